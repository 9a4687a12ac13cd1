// This is copyrighted software. More information is at the end of this file.
#include <stemdeck/channel.hh>

namespace stemdeck {
    channel::~channel() = default;
    channel_factory::~channel_factory() = default;
}


/*
 * Copyright (C) 2025
 *
 * This file is part of stemdeck.
 *
 * stemdeck is free software: you can redistribute it and/or modify it under the
 * terms of the GNU Lesser General Public License as published by the Free
 * Software Foundation, either version 3 of the License, or (at your option) any
 * later version.
 *
 * stemdeck is distributed in the hope that it will be useful, but WITHOUT ANY
 * WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR
 * A PARTICULAR PURPOSE.  See the GNU Lesser General Public License for more
 * details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with stemdeck.  If not, see <http://www.gnu.org/licenses/>.
 */
