/*
 * Umbra Ledger
 * Copyright (C) 2025 Joshua Olson
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
#include "utils.h"

// Both generators are hashed to Baby Jubjub from fixed tags, so nobody
// knows their discrete logs relative to each other.
const EcPoint& value_generator();
const EcPoint& blind_generator();

// v*G_V + blind*G_R
EcPoint pedersen_commitment_u64(uint64_t value, const Fs &blind);

EcPoint sum_commitments(const std::vector<EcPoint> &commits);
