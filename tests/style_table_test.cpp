#include "styletable.h"

#include <cassert>
#include <cmath>

int main() {
  StyleTable single = StyleTable::ForPreset(StylePreset::Single);
  const StyleRule &h1 = single.StyleFor(BlockKind::Heading1);
  assert(h1.fontSize == 18.0);
  assert(h1.bold);
  assert((h1.color == RgbColor{52, 152, 219}));
  assert(single.StyleFor(BlockKind::Heading2).color == (RgbColor{39, 174, 96}));
  assert(single.StyleFor(BlockKind::Paragraph).lineHeight == 14.0);
  const StyleRule &list = single.StyleFor(BlockKind::UnorderedList);
  assert(list.indent == 20.0);
  assert(list.itemGap == 2.0);
  assert(single.Table().fontSize == 10.0);
  assert(single.Table().startReserve == 160.0);
  assert(single.Banner().titleAlign == TextAlign::Center);
  assert(single.BlockStartReserve() == 60.0);

  StyleTable bundle = StyleTable::ForPreset(StylePreset::Bundle);
  assert(bundle.StyleFor(BlockKind::Heading1).fontSize == 16.0);
  assert(bundle.StyleFor(BlockKind::Paragraph).fontSize == 10.0);
  assert(bundle.Table().cellPadding == 3.0);
  assert(bundle.Banner().height == 60.0);
  assert(bundle.Banner().contentTop == 90.0);
  assert(bundle.Banner().titleAlign == TextAlign::Left);

  StyleTable summary = StyleTable::ForPreset(StylePreset::Summary);
  assert(summary.StyleFor(BlockKind::Paragraph).lineHeight == 15.0);
  assert(summary.StyleFor(BlockKind::OrderedList).itemGap == 2.0);
  assert(std::string(StylePresetName(summary.Preset())) == "summary");

  assert(single.ListMarker(BlockKind::UnorderedList, 1) == "\xE2\x80\xA2");
  assert(single.ListMarker(BlockKind::OrderedList, 7) == "7.");

  StyleTable custom;
  StyleRule big;
  big.fontSize = 30.0;
  custom.SetRule(BlockKind::Paragraph, big);
  assert(custom.StyleFor(BlockKind::Heading1).fontSize == 30.0);

  // Glyphs are centred in the line box.
  assert(std::abs(LineBaseline(100.0, 10.0, 14.0) - 110.0) < 1e-9);
  return 0;
}
