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

#include <QApplication>
#include <QMessageBox>

#include <memory>

#include "app/coordinator.hpp"
#include "qt_dispatch.hpp"
#include "solo_window.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);

    solo::app::Config cfg;
    cfg.dispatch_target = std::make_shared<QtDispatchTarget>(&app);

    auto cr = solo::app::Coordinator::create(std::move(cfg));
    if (!cr) {
        QMessageBox::critical(nullptr, "solo", QString::fromStdString(cr.st.msg));
        return 2;
    }
    auto& coord = *cr.value;

    auto id = coord.unique_name();
    const QString identity = id ? QString::fromStdString(id.value) : QString("<none>");

    std::unique_ptr<SoloWindow> window;
    const bool owner = coord.launch_or_return([&window](const solo::core::Payload& args) {
        if (window) window->onInvocation(args);
    });
    if (!owner) return 0;

    window = std::make_unique<SoloWindow>(identity);
    window->show();

    const int rc = app.exec();
    coord.stop_listening();
    return rc;
}
