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

#include "solo_window.hpp"
#include <QLabel>
#include <QMetaObject>
#include <QTextCursor>
#include <QTextEdit>
#include <QVBoxLayout>
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include "app/version.hpp"

static QString htmlEsc(const QString& s) {
    return s.toHtmlEscaped();
}

template <class Mutex>
class QtTextSink final : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit QtTextSink(SoloWindow* w) : w_(w) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);

        QString line = QString::fromUtf8(formatted.data(), static_cast<int>(formatted.size()));
        while (!line.isEmpty() && (line.endsWith('\n') || line.endsWith('\r'))) line.chop(1);
        if (line.isEmpty()) return;

        QMetaObject::invokeMethod(w_, [w=w_, s=htmlEsc(line)]() { w->appendLogLineFromEngine(s); },
                                  Qt::QueuedConnection);
    }

    void flush_() override {}

private:
    SoloWindow* w_ = nullptr;
};

static std::shared_ptr<spdlog::logger> make_qt_logger(SoloWindow* w) {
    auto sink = std::make_shared<QtTextSink<std::mutex>>(w);
    sink->set_pattern("%H:%M:%S %v");
    auto log = std::make_shared<spdlog::logger>("qt", spdlog::sinks_init_list{sink});
    log->set_level(spdlog::level::info);
    return log;
}

SoloWindow::SoloWindow(QString identity, QWidget* parent) : QWidget(parent) {
    setWindowTitle("solo");
    resize(640, 400);

    auto* mainLayout = new QVBoxLayout(this);
    mainLayout->setContentsMargins(10, 10, 10, 10);

    auto* bannerLabel = new QLabel(
        QString("<b>solo v%1</b>").arg(QString::fromStdString(solo::app::solo_version())),
        this
    );
    bannerLabel->setStyleSheet("background: qlineargradient(x1:0, y1:0, x2:1, y2:0, stop:0 #4c8ddc, stop:1 #8bbceb); color: white; font-size: 26px; padding: 10px; border-radius: 3px;");
    bannerLabel->setAlignment(Qt::AlignCenter);
    mainLayout->addWidget(bannerLabel);

    auto* idLabel = new QLabel(QString("Identity: <code>%1</code>").arg(htmlEsc(identity)), this);
    idLabel->setTextInteractionFlags(Qt::TextSelectableByMouse);
    mainLayout->addWidget(idLabel);

    counterLabel_ = new QLabel("No forwarded invocations yet.", this);
    mainLayout->addWidget(counterLabel_);

    consoleOutput = new QTextEdit(this);
    consoleOutput->setReadOnly(true);
    consoleOutput->setStyleSheet("font-family: Consolas, monospace; font-size: 11px;");
    mainLayout->addWidget(consoleOutput, 1);

    spdlog::set_default_logger(make_qt_logger(this));
}

SoloWindow::~SoloWindow() {
    // The sink points at this window.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>("null"));
}

void SoloWindow::onInvocation(const solo::core::Payload& args) {
    ++invocations_;
    counterLabel_->setText(QString("Forwarded invocations: %1").arg(invocations_));

    QStringList parts;
    for (const auto& a : args) parts << htmlEsc(QString::fromStdString(a));
    appendLogLine_(QString("<font color=\"#4c8ddc\">#%1</font> %2").arg(invocations_).arg(parts.join(' ')));

    raiseToFront_();
}

void SoloWindow::appendLogLineFromEngine(const QString& html) {
    appendLogLine_(html);
}

void SoloWindow::appendLogLine_(const QString& html) {
    consoleOutput->append(html);
    QTextCursor cursor = consoleOutput->textCursor();
    cursor.movePosition(QTextCursor::End);
    consoleOutput->setTextCursor(cursor);
}

void SoloWindow::raiseToFront_() {
    if (isMinimized()) showNormal();
    raise();
    activateWindow();
}
