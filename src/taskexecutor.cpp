/* Copyright (C) 2017-2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#include "taskexecutor.h"

#include <QDebug>
#include <utility>

TaskExecutor::Task::Task(std::function<void()> job) : m_job{std::move(job)} {}

void TaskExecutor::Task::run() { m_job(); }

TaskExecutor::TaskExecutor(QObject *parent, int threadCount)
    : m_pool{parent} {
    m_pool.setMaxThreadCount(threadCount);
}

bool TaskExecutor::startTask(std::function<void()> job) {
    if (m_pool.activeThreadCount() >= m_pool.maxThreadCount()) {
        qWarning() << "too many tasks, dropping new task";
        return false;
    }

    auto *task = new Task{std::move(job)};
    task->setAutoDelete(true);
    m_pool.start(task);
    return true;
}

void TaskExecutor::waitForDone() { m_pool.waitForDone(); }
