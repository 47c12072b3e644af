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
#include <initializer_list>

/*
 *  MiMC-7 over Fr, the one hash that circuits and native code share.
 *  The cipher is 91 rounds of x <- (x + k + c_i)^7 and hashing chains it
 *  in Miyaguchi-Preneel mode: h <- E_h(m) + h + m.
 */
constexpr size_t MIMC_ROUNDS = 91;

// round constants, c_0 is zero
const std::vector<Fr>& mimc_constants();

Fr mimc_cipher(const Fr &x, const Fr &key);
Fr mimc_hash(const std::vector<Fr> &elements, const Fr &iv);

// Hash(field elements) -> field element. The arity is the initial value.
Fr field_hash(std::initializer_list<Fr> elements);
Fr field_hash(const std::vector<Fr> &elements);
