// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * sampled_suffix_array.hpp
 *
 * Suffix array values divisible by the sampling rate, stored in BWT order.
 * A bit vector marks the BWT positions holding such a value. Other values
 * are recovered by LF steps until a marked position is reached; every step
 * decreases the SA value by one, so fewer than sampling_rate steps are taken.
 * Samples are chosen by SA value and not by BWT position, since BWT positions
 * divisible by the rate give no bound on the number of steps.
 *
 * All texts share the sentinel, so LF is not defined at BWT positions
 * holding a sentinel (the preceding text position is in another text). For
 * these positions, one per text, the SA value (the start of a text) is
 * stored in a hash map and the walk stops there.
 *
 */

#pragma once

#include <vector>

#include <sdsl/bit_vectors.hpp>
#include <sdsl/int_vector.hpp>
#include <sdsl/rank_support_v5.hpp>
#include <ankerl/unordered_dense.h>

#include "definitions.hpp"
#include "text_with_rank_support.hpp"
#include "utils.hpp"

namespace fmdex{

template<typename uint_t>
class sampled_suffix_array{

public:

	using text_start_map = ankerl::unordered_dense::map<uint_t,uint_t>;

	sampled_suffix_array(){}

	/*
	 * \param sampled marks the BWT positions i with SA[i] divisible by sampling_rate
	 * \param samples SA[i]/sampling_rate for the marked positions, in BWT order
	 * \param text_starts SA[i] for every BWT position i holding the sentinel
	 */
	sampled_suffix_array(ulint sampling_rate, sdsl::bit_vector&& sampled, sdsl::int_vector<>&& samples, text_start_map&& text_starts){

		this->sampling_rate = sampling_rate;
		this->sampled = std::move(sampled);
		this->samples = std::move(samples);
		this->text_starts = std::move(text_starts);

		sampled_rank = sdsl::rank_support_v5<>(&this->sampled);

	}

	// the rank support points into sampled, so it is rebound on every copy and move

	sampled_suffix_array(const sampled_suffix_array& other)
		: sampling_rate(other.sampling_rate), sampled(other.sampled), sampled_rank(other.sampled_rank),
		  samples(other.samples), text_starts(other.text_starts) {
		sampled_rank.set_vector(&sampled);
	}

	sampled_suffix_array(sampled_suffix_array&& other)
		: sampling_rate(other.sampling_rate), sampled(std::move(other.sampled)), sampled_rank(std::move(other.sampled_rank)),
		  samples(std::move(other.samples)), text_starts(std::move(other.text_starts)) {
		sampled_rank.set_vector(&sampled);
	}

	sampled_suffix_array& operator=(const sampled_suffix_array& other){

		if(this != &other){
			sampled_suffix_array tmp(other);
			*this = std::move(tmp);
		}

		return *this;

	}

	sampled_suffix_array& operator=(sampled_suffix_array&& other){

		if(this != &other){

			sampling_rate = other.sampling_rate;
			sampled = std::move(other.sampled);
			sampled_rank = std::move(other.sampled_rank);
			sampled_rank.set_vector(&sampled);
			samples = std::move(other.samples);
			text_starts = std::move(other.text_starts);

		}

		return *this;

	}

	/*
	 * SA value at BWT position i
	 * \param bwt the BWT with rank support
	 * \param C C[c] = number of symbols smaller than c in the BWT
	 */
	template<class block_t>
	ulint resolve(ulint i, const text_with_rank_support<block_t>& bwt, const std::vector<ulint>& C) const {

		ulint steps = 0;

		while(true){

			if(sampled[i] == 1)
				return ulint(samples[sampled_rank(i)])*sampling_rate + steps;

			uchar c = bwt.symbol_at_unchecked(i);

			if(c == 0) return ulint(text_starts.at(uint_t(i))) + steps;

			i = C[c] + bwt.rank_unchecked(c,i);
			steps++;

		}

	}

	ulint num_samples() const {
		return samples.size();
	}

	ulint num_text_starts() const {
		return text_starts.size();
	}

	/* serialize the structure to the ostream
	 * \param out	 the ostream
	 */
	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,sampling_rate);
		w_bytes += sampled.serialize(out);
		w_bytes += sampled_rank.serialize(out);
		w_bytes += samples.serialize(out);

		// the map is written as (BWT position, SA value) pairs
		std::vector<uint_t> flat;
		flat.reserve(2*text_starts.size());

		for(auto& entry : text_starts){
			flat.push_back(entry.first);
			flat.push_back(entry.second);
		}

		w_bytes += write_vector(out,flat);

		return w_bytes;

	}

	/* load the structure from the istream
	 * \param in the istream
	 */
	void load(std::istream& in){

		read_value(in,sampling_rate);
		sampled.load(in);
		sampled_rank.load(in,&sampled);
		samples.load(in);

		std::vector<uint_t> flat;
		read_vector(in,flat);

		text_starts.clear();
		text_starts.reserve(flat.size()/2);

		for(ulint j=0;j+1<flat.size();j+=2)
			text_starts[flat[j]] = flat[j+1];

	}

	uint64_t size_in_bytes() const {
		return
			sdsl::size_in_bytes(sampled) +
			sdsl::size_in_bytes(sampled_rank) +
			sdsl::size_in_bytes(samples) +
			text_starts.size()*2*sizeof(uint_t);
	}

private:

	ulint sampling_rate = 1;

	sdsl::bit_vector sampled; // BWT positions whose SA value is sampled
	sdsl::rank_support_v5<> sampled_rank;

	sdsl::int_vector<> samples; // SA value / sampling_rate

	text_start_map text_starts;

};

}
