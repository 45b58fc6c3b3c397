// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * batched_search.hpp
 *
 * Backward search for many queries at once. Queries are processed in
 * batches of BATCH_SIZE. In each round, every unfinished query of the batch
 * takes one backward search step: first the memory of all rank lookups of the
 * round is prefetched, then the steps are computed. Queries that are finished
 * (all symbols consumed or empty interval) are swapped behind the unfinished
 * ones and not touched again.
 *
 * The result for each query is the same as for a single backward search.
 *
 */

#pragma once

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "definitions.hpp"

namespace fmdex{

static constexpr ulint BATCH_SIZE = 32;

/*
 * interval of each query, or nullopt for queries with symbols outside the alphabet
 */
template<class index_t>
std::vector<std::optional<interval>> batched_intervals(const index_t& index, const std::vector<std::string>& queries){

	std::vector<std::optional<interval>> result(queries.size());

	std::vector<std::vector<uchar>> dense(BATCH_SIZE);
	std::vector<interval> intervals(BATCH_SIZE);
	std::vector<ulint> remaining(BATCH_SIZE); // symbols left of the matched suffix
	std::vector<ulint> slots(BATCH_SIZE);
	std::vector<uchar> symbols(BATCH_SIZE);

	const auto& bwt = index.get_bwt();

	for(ulint b=0;b<queries.size();b+=BATCH_SIZE){

		ulint batch_size = std::min<ulint>(BATCH_SIZE,queries.size()-b);
		ulint num_active = 0;

		// translation and lookup table priming for the whole batch
		for(ulint s=0;s<batch_size;++s){

			if(!index.try_to_dense(queries[b+s],dense[s])) continue;

			ulint consumed = 0;
			intervals[s] = index.prime(dense[s],consumed);
			remaining[s] = dense[s].size()-consumed;

			slots[num_active++] = s;

		}

		ulint num_valid = num_active;

		while(true){

			// move finished queries behind the unfinished ones
			ulint i = 0;

			while(i < num_active){

				ulint s = slots[i];

				if(remaining[s] > 0 && !intervals[s].empty()){
					i++;
					continue;
				}

				std::swap(slots[i],slots[num_active-1]);
				num_active--;

			}

			if(num_active == 0) break;

			for(ulint j=0;j<num_active;++j){

				ulint s = slots[j];

				symbols[s] = dense[s][remaining[s]-1];
				bwt.prefetch(intervals[s].lo);
				bwt.prefetch(intervals[s].hi);

			}

			for(ulint j=0;j<num_active;++j){

				ulint s = slots[j];

				intervals[s] = index.lf_step_unchecked(symbols[s],intervals[s]);
				remaining[s]--;

			}

		}

		for(ulint j=0;j<num_valid;++j){
			ulint s = slots[j];
			result[b+s] = intervals[s];
		}

	}

	return result;

}

}
