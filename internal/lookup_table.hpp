// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * lookup_table.hpp
 *
 * Backward search intervals of all k-mers over the searchable symbols. A
 * query whose last k symbols are searchable starts from the table entry of
 * these symbols instead of the full interval.
 *
 * The k-mer q_0 ... q_{k-1} (dense symbols 1..s, s = number of searchable
 * symbols) is stored at index sum_j (q_j - 1) * s^(k-1-j).
 *
 */

#pragma once

#include <vector>

#include <omp.h>

#include "definitions.hpp"
#include "utils.hpp"

namespace fmdex{

template<typename uint_t>
class lookup_table{

public:

	lookup_table(){}

	/*
	 * \param k depth of the table
	 * \param num_symbols number of searchable symbols s, these are the dense symbols 1..s
	 * \param n length of the BWT
	 * \param step backward search step: (dense symbol, interval) -> interval
	 * \param threads OpenMP threads used to fill a level
	 */
	template<class step_t>
	lookup_table(ulint k, ulint num_symbols, ulint n, step_t step, int threads){

		this->k = k;
		this->num_symbols = num_symbols;

		// depth 0: only the empty k-mer, matching everything
		std::vector<uint_t> prev = {uint_t(0),uint_t(n)};
		ulint prev_entries = 1;

		// the table of depth d is one step away from the table of depth d-1
		for(ulint d=1;d<=k;++d){

			ulint entries = prev_entries*num_symbols;
			std::vector<uint_t> cur(2*entries);

			#pragma omp parallel for schedule(static) num_threads(threads)
			for(int64_t idx=0;idx<int64_t(entries);++idx){

				ulint suffix_idx = ulint(idx) % prev_entries;
				uchar first = uchar(ulint(idx)/prev_entries + 1);

				interval I = step(first, interval{ulint(prev[2*suffix_idx]),ulint(prev[2*suffix_idx+1])});

				cur[2*idx] = uint_t(I.lo);
				cur[2*idx+1] = uint_t(I.hi);

			}

			prev = std::move(cur);
			prev_entries = entries;

		}

		table = std::move(prev);

	}

	ulint depth() const {
		return k;
	}

	/*
	 * stores in idx the table index of the k-mer kmer[0..k). Returns false if
	 * the k-mer contains a symbol that is not searchable
	 */
	bool index_of(const uchar* kmer, ulint& idx) const {

		idx = 0;

		for(ulint j=0;j<k;++j){

			if(kmer[j] == 0 || kmer[j] > num_symbols) return false;

			idx = idx*num_symbols + (kmer[j]-1);

		}

		return true;

	}

	interval at(ulint idx) const {
		return interval{ulint(table[2*idx]),ulint(table[2*idx+1])};
	}

	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,k);
		w_bytes += write_value(out,num_symbols);
		w_bytes += write_vector(out,table);

		return w_bytes;

	}

	void load(std::istream& in){

		read_value(in,k);
		read_value(in,num_symbols);
		read_vector(in,table);

	}

	uint64_t size_in_bytes() const {
		return table.size()*sizeof(uint_t);
	}

private:

	ulint k = 0;
	ulint num_symbols = 0;

	// lo and hi of each entry
	std::vector<uint_t> table;

};

}
