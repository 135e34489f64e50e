/* Copyright (C) 2024 Michal Kosciesza <michal@mkiol.net>
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */

#ifndef AUTOPLAYCONFIG_H
#define AUTOPLAYCONFIG_H

#include <QByteArray>
#include <QString>
#include <vector>

struct AutoPlayEntry {
    QString deviceName;
    QString videoPath;
    bool loop = true;
};

/*
 * Mapping of device friendly names to media played automatically when the
 * device shows up.
 */
class AutoPlayConfig {
   public:
    AutoPlayConfig() = default;
    explicit AutoPlayConfig(std::vector<AutoPlayEntry> entries);

    // Throws ConfigError
    static AutoPlayConfig fromJson(const QByteArray &data,
                                   const QString &baseDir = {});
    static AutoPlayConfig load(const QString &path);

    inline const std::vector<AutoPlayEntry> &entries() const {
        return m_entries;
    }
    inline bool empty() const { return m_entries.empty(); }

   private:
    std::vector<AutoPlayEntry> m_entries;
};

#endif  // AUTOPLAYCONFIG_H
