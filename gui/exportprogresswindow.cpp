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
#include "exportprogresswindow.h"

#include "logger.h"

ExportProgressWindow::ExportProgressWindow(wxWindow *parent, bool showAlerts)
    : parent_(parent), showAlerts_(showAlerts) {}

ExportProgressWindow::~ExportProgressWindow() { Hide(); }

void ExportProgressWindow::OnExportStarted() {
  if (frame_)
    return;

  frame_ = new wxFrame(parent_, wxID_ANY, "Exporting", wxDefaultPosition,
                       wxDefaultSize,
                       wxFRAME_NO_TASKBAR | wxSTAY_ON_TOP | wxCAPTION);

  wxPanel *panel = new wxPanel(frame_);
  wxBoxSizer *sizer = new wxBoxSizer(wxVERTICAL);

  label_ = new wxStaticText(panel, wxID_ANY, "Preparing export...",
                            wxDefaultPosition, wxSize(360, -1),
                            wxALIGN_CENTER | wxST_NO_AUTORESIZE);
  wxFont font = label_->GetFont();
  font.MakeBold();
  label_->SetFont(font);
  gauge_ = new wxGauge(panel, wxID_ANY, 100, wxDefaultPosition,
                       wxSize(360, -1));

  sizer->Add(label_, 0, wxEXPAND | wxALL, 16);
  sizer->Add(gauge_, 0, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 16);
  panel->SetSizerAndFit(sizer);

  frame_->SetClientSize(panel->GetBestSize());
  frame_->CentreOnScreen();
  frame_->Show();
  frame_->Raise();
  frame_->Update();
}

void ExportProgressWindow::OnProgress(const std::string &message) {
  Logger::Instance().Log(message);
  if (!label_)
    return;
  label_->SetLabel(wxString::FromUTF8(message.c_str()));
  label_->GetParent()->Layout();
  label_->Refresh();
  label_->Update();
  gauge_->Pulse();
  if (wxTheApp)
    wxTheApp->SafeYieldFor(nullptr, wxEVT_CATEGORY_UI);
}

void ExportProgressWindow::OnAlert(const std::string &message) {
  if (!showAlerts_)
    return;
  wxMessageBox(wxString::FromUTF8(message.c_str()), "Export",
               wxOK | wxICON_ERROR, frame_ ? frame_ : parent_);
}

void ExportProgressWindow::OnExportFinished() { Hide(); }

void ExportProgressWindow::Hide() {
  if (frame_) {
    frame_->Destroy();
    frame_ = nullptr;
    label_ = nullptr;
    gauge_ = nullptr;
  }
}
