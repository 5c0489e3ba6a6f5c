/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#pragma once

#include <QString>
#include <QWidget>

#include <atomic>

#include "core/payload_codec.hpp"

class QLabel;
class QTextEdit;

class SoloWindow : public QWidget {
 public:
    explicit SoloWindow(QString identity, QWidget* parent = nullptr);
    ~SoloWindow() override;

    // Shows one forwarded invocation and brings the window to the front.
    void onInvocation(const solo::core::Payload& args);

    void appendLogLineFromEngine(const QString& html);

 private:
    void appendLogLine_(const QString& html);
    void raiseToFront_();

 private:
    QLabel* counterLabel_ = nullptr;
    QTextEdit* consoleOutput = nullptr;
    int invocations_ = 0;
};
