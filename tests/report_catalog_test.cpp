#include "reportcatalog.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>

int main() {
  ReportCatalog catalog = ReportCatalog::Default();
  assert(catalog.Size() == 16);
  assert(catalog.Types().front().id == "swot-analysis");
  assert(catalog.Types().back().id == "pivot-ideas");
  const ReportType *type = catalog.Find("30-60-90");
  assert(type != nullptr);
  assert(type->name == "30-60-90 Plan");
  assert(catalog.Find("missing") == nullptr);

  std::string error;
  ReportCatalog loaded;
  assert(ReportCatalog::LoadFromString(
      R"([{"id":"a","name":"Alpha","description":"first"},{"id":"b"}])",
      loaded, error));
  assert(loaded.Size() == 2);
  assert(loaded.Types()[1].name == "b");

  ReportCatalog untouched = ReportCatalog::Default();
  assert(!ReportCatalog::LoadFromString(R"([{"id":"a"},{"id":"a"}])",
                                        untouched, error));
  assert(!error.empty());
  assert(untouched.Size() == 16);
  assert(!ReportCatalog::LoadFromString(R"([{"name":"No id"}])", untouched,
                                        error));
  assert(!ReportCatalog::LoadFromString("[]", untouched, error));
  assert(!ReportCatalog::LoadFromString(R"({"id":"a"})", untouched, error));
  assert(!ReportCatalog::LoadFromString("[{", untouched, error));

  const std::filesystem::path path = std::filesystem::temp_directory_path() /
                                     "compareports_catalog_test.json";
  {
    std::ofstream out(path);
    out << R"([{"id":"x","name":"X Report","description":"d"}])";
  }
  assert(ReportCatalog::LoadFromFile(path.string(), loaded, error));
  assert(loaded.Find("x")->name == "X Report");
  std::error_code ec;
  std::filesystem::remove(path, ec);
  assert(!ReportCatalog::LoadFromFile(path.string(), loaded, error));
  return 0;
}
