/*
    This file is part of the KDE project
    SPDX-FileCopyrightText: 2020 Ahmad Samir <a.samirh78@gmail.com>
    SPDX-FileCopyrightText: 2026 KTransact Developers

    SPDX-License-Identifier: LGPL-2.0-only OR LGPL-3.0-only OR LicenseRef-KDE-Accepted-LGPL
*/

#include "conflictresolverinterface.h"

using namespace KTransact;

ConflictResolverInterface::ConflictResolverInterface() = default;

ConflictResolverInterface::~ConflictResolverInterface() = default;
