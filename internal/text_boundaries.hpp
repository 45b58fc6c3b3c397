// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * text_boundaries.hpp
 *
 * Maps offsets in the concatenation of all texts (each followed by a
 * sentinel) back to (text id, position in text). The sentinel positions are
 * stored in a sparse bit vector: the text id of an offset is the number of
 * sentinels before it, the start of text t is one past the t-th sentinel.
 *
 */

#pragma once

#include <stdexcept>
#include <vector>

#include <sdsl/sd_vector.hpp>

#include "definitions.hpp"
#include "utils.hpp"

namespace fmdex{

class text_boundaries{

public:

	text_boundaries(){}

	/*
	 * \param sentinel_positions offset of the sentinel after each text, increasing
	 */
	text_boundaries(const std::vector<ulint>& sentinel_positions){

		sentinels = sdsl::sd_vector<>(sentinel_positions.begin(),sentinel_positions.end());
		num_sentinels = sentinel_positions.size();

		sentinels_rank.set_vector(&sentinels);
		sentinels_select.set_vector(&sentinels);

	}

	// rank and select point into sentinels, so they are rebound on every copy and move

	text_boundaries(const text_boundaries& other)
		: sentinels(other.sentinels), num_sentinels(other.num_sentinels) {
		sentinels_rank.set_vector(&sentinels);
		sentinels_select.set_vector(&sentinels);
	}

	text_boundaries(text_boundaries&& other)
		: sentinels(std::move(other.sentinels)), num_sentinels(other.num_sentinels) {
		sentinels_rank.set_vector(&sentinels);
		sentinels_select.set_vector(&sentinels);
	}

	text_boundaries& operator=(const text_boundaries& other){

		if(this != &other){
			text_boundaries tmp(other);
			*this = std::move(tmp);
		}

		return *this;

	}

	text_boundaries& operator=(text_boundaries&& other){

		if(this != &other){

			sentinels = std::move(other.sentinels);
			num_sentinels = other.num_sentinels;
			sentinels_rank.set_vector(&sentinels);
			sentinels_select.set_vector(&sentinels);

		}

		return *this;

	}

	/*
	 * text id and position inside that text of the concatenation offset global
	 */
	hit to_hit(ulint global) const {

		if(global >= sentinels.size())
			throw std::out_of_range("offset " + std::to_string(global) + " is past the last text");

		ulint text_id = sentinels_rank(global);
		ulint start = text_id == 0 ? 0 : sentinels_select(text_id)+1;

		return hit{text_id, global - start};

	}

	ulint num_texts() const {
		return num_sentinels;
	}

	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,num_sentinels);
		w_bytes += sentinels.serialize(out);

		return w_bytes;

	}

	void load(std::istream& in){

		read_value(in,num_sentinels);
		sentinels.load(in);

		sentinels_rank.set_vector(&sentinels);
		sentinels_select.set_vector(&sentinels);

	}

	uint64_t size_in_bytes() const {
		return sdsl::size_in_bytes(sentinels);
	}

private:

	sdsl::sd_vector<> sentinels; // bit i set iff the concatenation has a sentinel at offset i
	ulint num_sentinels = 0;

	sdsl::sd_vector<>::rank_1_type sentinels_rank;
	sdsl::sd_vector<>::select_1_type sentinels_select;

};

}
