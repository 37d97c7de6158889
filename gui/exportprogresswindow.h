/*
 * This file is part of CompaReports.
 * Copyright (C) 2025 Luisma Peramato
 *
 * CompaReports is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * CompaReports is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with CompaReports. If not, see <https://www.gnu.org/licenses/>.
 */
#pragma once

#include <wx/wx.h>

#include "reportproviders.h"

// Small always-on-top window showing the current export step. Alerts
// are shown as message boxes.
class ExportProgressWindow : public ExportProgressListener {
public:
  explicit ExportProgressWindow(wxWindow *parent = nullptr,
                                bool showAlerts = true);
  ~ExportProgressWindow() override;

  void OnExportStarted() override;
  void OnProgress(const std::string &message) override;
  void OnAlert(const std::string &message) override;
  void OnExportFinished() override;

private:
  void Hide();

  wxWindow *parent_ = nullptr;
  bool showAlerts_ = true;
  wxFrame *frame_ = nullptr;
  wxStaticText *label_ = nullptr;
  wxGauge *gauge_ = nullptr;
};
