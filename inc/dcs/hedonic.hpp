/**
 * \file dcs/hedonic.hpp
 *
 * \brief Nash-stable assignments in star hedonic games.
 *
 * \author dcsxx-hedonic developers
 *
 * <hr/>
 *
 * Copyright (C) 2026       dcsxx-hedonic developers
 *
 * This file is part of dcsxx-hedonic (below referred to as "this program").
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published
 * by the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <http://www.gnu.org/licenses/>.
 */

#ifndef DCS_HEDONIC_HPP
#define DCS_HEDONIC_HPP


#include <dcs/hedonic/colouring.hpp>
#include <dcs/hedonic/commons.hpp>
#include <dcs/hedonic/configuration.hpp>
#include <dcs/hedonic/hypotheses.hpp>
#include <dcs/hedonic/scenario.hpp>
#include <dcs/hedonic/search.hpp>
#include <dcs/hedonic/stability.hpp>


#endif // DCS_HEDONIC_HPP
