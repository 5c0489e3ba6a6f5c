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

#include <QCoreApplication>
#include <QMetaObject>
#include <QPointer>

#include <functional>
#include <utility>

#include "core/dispatch.hpp"

// Runs forwarded work on the thread of |ctx|, normally the GUI thread.
class QtDispatchTarget final : public solo::core::DispatchTarget {
 public:
    explicit QtDispatchTarget(QObject* ctx = QCoreApplication::instance()) : ctx_(ctx) {}

    bool post(std::function<void()> fn) override {
        if (!ctx_ || QCoreApplication::closingDown()) return false;
        return QMetaObject::invokeMethod(ctx_.data(), std::move(fn), Qt::QueuedConnection);
    }

 private:
    QPointer<QObject> ctx_;
};
