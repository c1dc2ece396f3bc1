// SPDX-License-Identifier: GPL-3.0-or-later

/* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * *
*
* Copyright (C) 2013 - 2024, nymea GmbH
* Copyright (C) 2024 - 2025, chargebyte austria GmbH
*
* This file is part of powermonitor.
*
* powermonitor is free software: you can redistribute it and/or modify
* it under the terms of the GNU General Public License as published by
* the Free Software Foundation, either version 3 of the License, or
* (at your option) any later version.
*
* powermonitor is distributed in the hope that it will be useful,
* but WITHOUT ANY WARRANTY; without even the implied warranty of
* MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
* GNU General Public License for more details.
*
* You should have received a copy of the GNU General Public License
* along with powermonitor. If not, see <https://www.gnu.org/licenses/>.
*
* * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * */

#ifndef DISKSPACEINFO_H
#define DISKSPACEINFO_H

#include <QString>

class DiskSpaceInfo
{
public:
    virtual ~DiskSpaceInfo() = default;

    // Sizes of the volume holding path, in bytes. -1 if unknown.
    virtual qint64 bytesTotal(const QString &path) const = 0;
    virtual qint64 bytesFree(const QString &path) const = 0;
};

class VolumeDiskSpaceInfo : public DiskSpaceInfo
{
public:
    qint64 bytesTotal(const QString &path) const override;
    qint64 bytesFree(const QString &path) const override;
};

#endif // DISKSPACEINFO_H
