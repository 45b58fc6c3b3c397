// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * fm_index.hpp
 *
 * FM-index over a collection of texts: counts and locates exact occurrences
 * of queries with backward search.
 *
 * uint_t bounds the corpus length and determines the suffix array
 * construction (int32_t: 32 bit libsais, uint32_t and int64_t: 64 bit
 * libsais). block_t is the block type of the rank structure.
 *
 * After construction the index is immutable and can be queried from any
 * number of threads.
 *
 */

#pragma once

#include <fstream>
#include <optional>
#include <string>
#include <type_traits>
#include <vector>

#include <malloc_count.h>

#include "alphabet.hpp"
#include "batched_search.hpp"
#include "block.hpp"
#include "config.hpp"
#include "construction.hpp"
#include "cursor.hpp"
#include "definitions.hpp"
#include "lookup_table.hpp"
#include "sampled_suffix_array.hpp"
#include "text_boundaries.hpp"
#include "text_with_rank_support.hpp"
#include "utils.hpp"

namespace fmdex{

template	<	typename uint_t = int32_t,
				class block_t = block64
			>
class fm_index{

	static_assert(
		std::is_same_v<uint_t,int32_t> || std::is_same_v<uint_t,uint32_t> || std::is_same_v<uint_t,int64_t>,
		"offset type must be int32_t, uint32_t or int64_t"
	);

public:

	using cursor_type = cursor<fm_index>;
	using hit_range_type = hit_range<fm_index>;

	// "FMDEXIDX"
	static constexpr uint64_t MAGIC = 0x5844495845444d46;
	static constexpr uint32_t VERSION = 1;

	fm_index(){}

	/*
	 * Build index
	 * \param texts byte strings (std::string, std::vector<uchar>, ...)
	 */
	template<typename text_t>
	fm_index(const std::vector<text_t>& texts, const alphabet& alpha, const fm_index_config& config = fm_index_config()){

		auto start_time = now();
		bool log = config.log;

		this->alpha = alpha;
		this->config = config;

		auto data = construct_index<uint_t,block_t>(texts,alpha,config);

		n = data.n;
		C = std::move(data.C);
		bwt = std::move(data.bwt);
		samples = std::move(data.samples);
		boundaries = std::move(data.boundaries);

		if(config.lookup_table_depth > 0){

			auto time = now();

			if (log) std::cout << "building lookup table (depth " << config.lookup_table_depth << ")" << std::flush;

			table = lookup_table<uint_t>(
				config.lookup_table_depth,
				alpha.num_searchable_symbols(),
				n,
				[this](uchar c, interval I){ return lf_step_unchecked(c,I); },
				construction_threads(config)
			);

			if (log) time = log_runtime(time);

		}

		if (log) {
			std::cout << std::endl;
			std::cout << "construction time: " << format_time(time_diff_ns(start_time,now())) << std::endl;
			std::cout << "peak memory usage: " << format_size(malloc_count_peak()) << std::endl;
			log_data_structure_sizes();
		}

	}

	/*
	 * number of occurrences of query in all texts
	 */
	ulint count(const std::string& query) const {
		return cursor_for_query(query).count();
	}

	/*
	 * occurrences of query in BWT order, resolved while iterating
	 */
	hit_range_type locate(const std::string& query) const {
		return cursor_for_query(query).locate();
	}

	std::vector<hit> locate_all(const std::string& query) const {
		return locate(query).to_vector();
	}

	/*
	 * cursor for the empty query: interval [0,n)
	 */
	cursor_type cursor_empty() const {
		return cursor_type(this,interval{0,n},0);
	}

	/*
	 * cursor after matching the whole query. Throws query_input_error if a
	 * query byte is not in the alphabet
	 */
	cursor_type cursor_for_query(const std::string& query) const {

		std::vector<uchar> dense = to_dense(query);

		ulint consumed = 0;
		cursor_type c(this,prime(dense,consumed),consumed);

		for(ulint j=dense.size()-consumed;j>0;--j)
			c.extend_left_dense(dense[j-1]);

		return c;

	}

	/*
	 * interval stored in the lookup table for kmer. kmer must have length
	 * lookup_table_depth() and contain only searchable symbols
	 */
	interval lookup_interval(const std::string& kmer) const {

		if(table.depth() == 0 || kmer.size() != table.depth())
			throw std::invalid_argument(
				"lookup_interval needs a query of length " + std::to_string(table.depth()) +
				", got " + std::to_string(kmer.size())
			);

		std::vector<uchar> dense = to_dense(kmer);

		ulint idx = 0;

		if(!table.index_of(dense.data(),idx))
			throw std::invalid_argument("lookup_interval: " + kmer + " contains symbols that are not searchable");

		return table.at(idx);

	}

	/*
	 * backward search step: interval of c*Q from the interval of Q, for a
	 * dense symbol c. Empty intervals stay unchanged.
	 */
	interval lf_step(uchar c, interval I) const {

		if(c >= alpha.size())
			throw std::out_of_range("lf_step: symbol " + std::to_string(ulint(c)) + " not in the alphabet");

		if(I.lo > I.hi || I.hi > n)
			throw std::out_of_range("lf_step: interval [" + std::to_string(I.lo) + "," + std::to_string(I.hi) + ") not inside [0," + std::to_string(n) + ")");

		return lf_step_unchecked(c,I);

	}

	interval lf_step_unchecked(uchar c, interval I) const {

		if(I.empty()) return I;

		return interval{C[c] + bwt.rank_unchecked(c,I.lo), C[c] + bwt.rank_unchecked(c,I.hi)};

	}

	/*
	 * cursors for many queries at once, in input order. nullopt for queries
	 * with bytes outside the alphabet
	 */
	std::vector<std::optional<cursor_type>> cursors_for_queries(const std::vector<std::string>& queries) const {

		auto intervals = batched_intervals(*this,queries);
		std::vector<std::optional<cursor_type>> result(queries.size());

		for(ulint q=0;q<queries.size();++q)
			if(intervals[q])
				result[q] = cursor_type(this,*intervals[q],queries[q].size());

		return result;

	}

	std::vector<std::optional<ulint>> count_many(const std::vector<std::string>& queries) const {

		auto intervals = batched_intervals(*this,queries);
		std::vector<std::optional<ulint>> result(queries.size());

		for(ulint q=0;q<queries.size();++q)
			if(intervals[q])
				result[q] = intervals[q]->size();

		return result;

	}

	std::vector<std::optional<std::vector<hit>>> locate_many(const std::vector<std::string>& queries) const {

		auto intervals = batched_intervals(*this,queries);
		std::vector<std::optional<std::vector<hit>>> result(queries.size());

		for(ulint q=0;q<queries.size();++q)
			if(intervals[q])
				result[q] = hit_range_type(this,*intervals[q]).to_vector();

		return result;

	}

	/*
	 * SA value at BWT position i < n
	 */
	ulint resolve(ulint i) const {

		if(i >= n)
			throw std::out_of_range("resolve: position " + std::to_string(i) + " not smaller than " + std::to_string(n));

		return samples.resolve(i,bwt,C);

	}

	/*
	 * text id and position of the suffix at BWT position i
	 */
	hit hit_at(ulint i) const {
		return boundaries.to_hit(samples.resolve(i,bwt,C));
	}

	/*
	 * dense symbols of query. Throws query_input_error at the first byte
	 * outside the alphabet
	 */
	std::vector<uchar> to_dense(const std::string& query) const {

		std::vector<uchar> dense;

		if(!try_to_dense(query,dense)){

			ulint pos = 0;
			while(alpha.contains(char_to_uchar(query[pos]))) pos++;

			throw query_input_error(
				"query byte " + std::to_string(ulint(char_to_uchar(query[pos]))) +
				" at position " + std::to_string(pos) + " is not in the alphabet",
				pos
			);

		}

		return dense;

	}

	bool try_to_dense(const std::string& query, std::vector<uchar>& dense) const {

		dense.resize(query.size());

		for(ulint i=0;i<query.size();++i){

			dense[i] = alpha.to_dense(char_to_uchar(query[i]));

			if(dense[i] == alphabet::INVALID) return false;

		}

		return true;

	}

	/*
	 * start interval for the dense query: the lookup table entry of its last
	 * k symbols if there is one, the full interval otherwise. consumed is
	 * set to the number of query symbols already matched
	 */
	interval prime(const std::vector<uchar>& dense, ulint& consumed) const {

		ulint k = table.depth();
		ulint idx = 0;

		if(k > 0 && dense.size() >= k && table.index_of(dense.data()+dense.size()-k,idx)){
			consumed = k;
			return table.at(idx);
		}

		consumed = 0;
		return interval{0,n};

	}

	/*
	 * length of the concatenation of all texts, sentinels included
	 */
	ulint size() const {
		return n;
	}

	ulint num_texts() const {
		return boundaries.num_texts();
	}

	ulint lookup_table_depth() const {
		return table.depth();
	}

	const alphabet& get_alphabet() const {
		return alpha;
	}

	const fm_index_config& get_config() const {
		return config;
	}

	const text_with_rank_support<block_t>& get_bwt() const {
		return bwt;
	}

	/*
	 * 0 for int32_t, 1 for uint32_t, 2 for int64_t. Stored in the index file
	 */
	static uchar offset_type_id(){

		if constexpr (std::is_same_v<uint_t,int32_t>) return 0;
		else if constexpr (std::is_same_v<uint_t,uint32_t>) return 1;
		else return 2;

	}

	/* serialize the structure to the ostream
	 * \param out	 the ostream
	 */
	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,MAGIC);
		w_bytes += write_value(out,VERSION);
		w_bytes += write_value(out,offset_type_id());
		w_bytes += write_value(out,block_t::num_bits);

		w_bytes += config.serialize(out);
		w_bytes += alpha.serialize(out);
		w_bytes += write_value(out,n);
		w_bytes += write_vector(out,C);
		w_bytes += bwt.serialize(out);
		w_bytes += samples.serialize(out);
		w_bytes += boundaries.serialize(out);
		w_bytes += table.serialize(out);

		return w_bytes;

	}

	/* load the structure from the istream
	 * \param in the istream
	 */
	void load(std::istream& in){

		uint64_t magic = 0;
		uint32_t version = 0;
		uchar type_id = 0;
		ulint block_bits = 0;

		read_value(in,magic);

		if(magic != MAGIC)
			throw std::runtime_error("not an fmdex index");

		read_value(in,version);

		if(version != VERSION)
			throw std::runtime_error("unsupported index format version " + std::to_string(version));

		read_value(in,type_id);

		if(type_id != offset_type_id())
			throw std::runtime_error("index was built with a different offset type");

		read_value(in,block_bits);

		if(block_bits != block_t::num_bits)
			throw std::runtime_error("index was built with block size " + std::to_string(block_bits));

		config.load(in);
		alpha.load(in);
		read_value(in,n);
		read_vector(in,C);
		bwt.load(in);
		samples.load(in);
		boundaries.load(in);
		table.load(in);

		if(!in)
			throw std::runtime_error("unexpected end of index data");

	}

	/*
	 * writes the index to path_prefix.fmd
	 */
	void save_to_file(std::string path_prefix) const {

		std::string path = std::string(path_prefix).append(".fmd");

		std::ofstream out(path,std::ios::binary);

		if(!out)
			throw std::runtime_error("cannot open " + path + " for writing");

		serialize(out);
		out.close();

	}

	void load_from_file(std::string path){

		std::ifstream in(path,std::ios::binary);

		if(!in)
			throw std::runtime_error("cannot open " + path);

		load(in);
		in.close();

	}

	uint64_t size_in_bytes() const {

		uint64_t size = 0;

		size += C.size()*sizeof(ulint);
		size += bwt.size_in_bytes();
		size += samples.size_in_bytes();
		size += boundaries.size_in_bytes();
		size += table.size_in_bytes();

		return size;

	}

	void log_data_structure_sizes() const {

		std::cout << "index size: " << format_size(size_in_bytes()) << std::endl;

		std::cout << "BWT with rank support: " << format_size(bwt.size_in_bytes()) << std::endl;
		std::cout << "sampled suffix array: " << format_size(samples.size_in_bytes()) << std::endl;
		std::cout << "text boundaries: " << format_size(boundaries.size_in_bytes()) << std::endl;
		std::cout << "lookup table: " << format_size(table.size_in_bytes()) << std::endl;

	}

private:

	alphabet alpha;
	fm_index_config config;

	ulint n = 0; // length of the concatenation, sentinels included

	std::vector<ulint> C;

	text_with_rank_support<block_t> bwt;
	sampled_suffix_array<uint_t> samples;
	text_boundaries boundaries;
	lookup_table<uint_t> table;

};

/*
 * offset type id (see fm_index::offset_type_id) of the index stored in path
 */
inline uchar read_offset_type_id(const std::string& path){

	std::ifstream in(path,std::ios::binary);

	if(!in)
		throw std::runtime_error("cannot open " + path);

	uint64_t magic = 0;
	uint32_t version = 0;
	uchar type_id = 0;

	read_value(in,magic);
	read_value(in,version);
	read_value(in,type_id);

	if(magic != fm_index<>::MAGIC)
		throw std::runtime_error(path + " is not an fmdex index");

	if(version != fm_index<>::VERSION)
		throw std::runtime_error(path + " has unsupported index format version " + std::to_string(version));

	return type_id;

}

}
