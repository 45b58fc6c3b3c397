// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * construction.hpp
 *
 * Builds the BWT with rank support, the sampled suffix array, the text
 * boundaries and the C array of a collection of texts.
 *
 * The texts are encoded with the alphabet and concatenated, each followed by
 * the sentinel 0. After the suffix array is built, one pass over it produces
 * the BWT, the suffix array samples and the SA values at sentinel positions
 * of the BWT. The suffix array is freed before the rank structure is built.
 *
 */

#pragma once

#include <algorithm>
#include <vector>

#include <omp.h>
#include <sdsl/bit_vectors.hpp>
#include <sdsl/int_vector.hpp>

#include "alphabet.hpp"
#include "config.hpp"
#include "definitions.hpp"
#include "packing.hpp"
#include "sampled_suffix_array.hpp"
#include "suffix_array_construction.hpp"
#include "text_boundaries.hpp"
#include "text_with_rank_support.hpp"
#include "utils.hpp"

namespace fmdex{

template<typename uint_t, class block_t>
struct construction_result{

	ulint n = 0;
	std::vector<ulint> C;
	text_with_rank_support<block_t> bwt;
	sampled_suffix_array<uint_t> samples;
	text_boundaries boundaries;

};

/*
 * dense encoding of all texts, each followed by the sentinel, into text.
 * Throws input_error at the first byte (smallest text id, then smallest
 * position) that is not in the alphabet.
 */
template<typename text_t>
void encode_texts(
	const std::vector<text_t>& texts,
	const alphabet& alpha,
	const std::vector<ulint>& starts,
	std::vector<uchar>& text,
	int threads
){

	ulint num_texts = texts.size();

	// first invalid position per text, or -1
	std::vector<int64_t> invalid(num_texts,-1);

	#pragma omp parallel for schedule(dynamic,1) num_threads(threads)
	for(int64_t t=0;t<int64_t(num_texts);++t){

		const text_t& T = texts[t];
		ulint start = starts[t];

		for(ulint i=0;i<T.size();++i){

			uchar c = alpha.to_dense(uchar(T[i]));

			if(c == alphabet::INVALID){
				invalid[t] = int64_t(i);
				break;
			}

			text[start+i] = c;

		}

		text[start+T.size()] = alphabet::SENTINEL;

	}

	for(ulint t=0;t<num_texts;++t){

		if(invalid[t] >= 0){

			ulint pos = ulint(invalid[t]);
			uchar c = uchar(texts[t][pos]);

			throw input_error(
				"text " + std::to_string(t) + " contains byte " + std::to_string(ulint(c)) +
				" at position " + std::to_string(pos) + ", which is not in the alphabet",
				t, pos
			);

		}

	}

}

/*
 * one pass over the suffix array: writes BWT[i] = text[SA[i]-1] (text[n-1]
 * for SA[i] = 0) into bwt, marks i in sampled and appends SA[i]/rate to
 * samples if SA[i] is divisible by rate, and stores SA[i] in text_starts
 * wherever BWT[i] is the sentinel.
 */
template<class packing_t, typename sa_t, typename uint_t>
void bwt_and_samples(
	const std::vector<sa_t>& SA,
	const uchar* text,
	uchar* bwt,
	ulint n,
	ulint rate,
	sdsl::bit_vector& sampled,
	sdsl::int_vector<>& samples,
	typename sampled_suffix_array<uint_t>::text_start_map& text_starts,
	int threads
){

	// chunks start at a multiple of 64, so that no two threads write to the
	// same word of sampled, and at an even position for half bytes
	ulint unit = 128;
	ulint chunk_size = std::max(unit, div_ceil(div_ceil(n,ulint(threads)*4),unit)*unit);
	ulint num_chunks = div_ceil(n,chunk_size);

	sampled = sdsl::bit_vector(n,0);

	std::vector<std::vector<uint_t>> local_samples(num_chunks);
	std::vector<typename sampled_suffix_array<uint_t>::text_start_map> local_starts(num_chunks);

	#pragma omp parallel for schedule(dynamic,1) num_threads(threads)
	for(int64_t ch=0;ch<int64_t(num_chunks);++ch){

		ulint begin = ulint(ch)*chunk_size;
		ulint end = std::min(begin+chunk_size,n);

		for(ulint i=begin;i<end;++i){

			ulint v = ulint(SA[i]);
			uchar c = packing_t::get(text, v > 0 ? v-1 : n-1);

			packing_t::set(bwt,i,c);

			if(v%rate == 0){
				sampled[i] = 1;
				local_samples[ch].push_back(uint_t(v/rate));
			}

			if(c == alphabet::SENTINEL) local_starts[ch][uint_t(i)] = uint_t(v);

		}

	}

	samples.width(bitsize(n/rate));
	samples.resize(div_ceil(n,rate));

	ulint j = 0;

	for(ulint ch=0;ch<num_chunks;++ch){

		for(uint_t v : local_samples[ch])
			samples[j++] = ulint(v);

		std::vector<uint_t>().swap(local_samples[ch]);

	}

	for(auto& m : local_starts)
		for(auto& entry : m)
			text_starts[entry.first] = entry.second;

}

/*
 * C[c] = number of symbols smaller than c, for c in [0,sigma]
 */
template<class block_t>
std::vector<ulint> compute_C(const text_with_rank_support<block_t>& bwt){

	ulint sigma = bwt.alphabet_size();
	std::vector<ulint> C(sigma+1,0);

	for(ulint c=0;c<sigma;++c)
		C[c+1] = C[c] + bwt.rank(uchar(c),bwt.size());

	return C;

}

/*
 * texts: any container of byte strings with size() and operator[]
 */
template<typename uint_t, class block_t, typename text_t>
construction_result<uint_t,block_t> construct_index(
	const std::vector<text_t>& texts,
	const alphabet& alpha,
	const fm_index_config& config
){

	using sa_t = saca_value_t<uint_t>;

	auto time = now();

	bool log = config.log;

	validate_config(config,block_t::num_bits,alpha.num_searchable_symbols());

	if(texts.empty())
		throw input_error("cannot build an index without texts",0,0);

	int threads = construction_threads(config);

	construction_result<uint_t,block_t> result;

	ulint num_texts = texts.size();
	ulint sigma = alpha.size();

	std::vector<ulint> starts(num_texts);
	std::vector<ulint> sentinel_positions(num_texts);
	ulint n = 0;

	for(ulint t=0;t<num_texts;++t){
		starts[t] = n;
		n += texts[t].size();
		sentinel_positions[t] = n;
		n++;
	}

	validate_corpus_length<uint_t>(n);

	result.n = n;
	result.boundaries = text_boundaries(sentinel_positions);

	if (log) std::cout << "texts: " << num_texts << ", n = " << n << " (sentinels included), sigma = " << sigma << std::endl;
	if (log) std::cout << "encoding texts" << std::flush;

	// even size, so that the second half of the buffer can hold the half byte packed BWT
	std::vector<uchar> text(n + n%2,0);
	encode_texts(texts,alpha,starts,text,threads);

	if (log) time = log_runtime(time);
	if (log) std::cout << "building suffix array (" << saca_name(config.saca) << ", " << sizeof(sa_t)*8 << " bit)" << std::flush;

	std::vector<sa_t> SA = construct_suffix_array<sa_t>(text.data(),n,sigma,config.saca,threads);

	if (log) time = log_runtime(time);

	bool half_bytes = config.low_memory && sigma <= 16;

	ulint rate = config.sa_sampling_rate;
	sdsl::bit_vector sampled;
	sdsl::int_vector<> samples;

	typename sampled_suffix_array<uint_t>::text_start_map text_starts;

	std::vector<uchar> bwt_buffer;
	const uchar* bwt = nullptr;

	if(half_bytes){

		if (log) std::cout << "packing text into half bytes and computing BWT and SA samples" << std::flush;

		half_byte_packing::pack_in_place(text.data(),n);
		uchar* bwt_half = text.data() + half_byte_packing::bytes(n);

		bwt_and_samples<half_byte_packing,sa_t,uint_t>(SA,text.data(),bwt_half,n,rate,sampled,samples,text_starts,threads);
		bwt = bwt_half;

	}else{

		if (log) std::cout << "computing BWT and SA samples" << std::flush;

		bwt_buffer.resize(n);
		bwt_and_samples<byte_packing,sa_t,uint_t>(SA,text.data(),bwt_buffer.data(),n,rate,sampled,samples,text_starts,threads);
		bwt = bwt_buffer.data();

	}

	std::vector<sa_t>().swap(SA);

	result.samples = sampled_suffix_array<uint_t>(rate,std::move(sampled),std::move(samples),std::move(text_starts));

	if (log) time = log_runtime(time);
	if (log) std::cout << "building rank support for the BWT" << std::flush;

	if(half_bytes)
		result.bwt = text_with_rank_support<block_t>(bwt,n,sigma,config.superblock_size,half_byte_packing(),threads);
	else
		result.bwt = text_with_rank_support<block_t>(bwt,n,sigma,config.superblock_size,byte_packing(),threads);

	std::vector<uchar>().swap(bwt_buffer);
	std::vector<uchar>().swap(text);

	result.C = compute_C(result.bwt);

	if (log) time = log_runtime(time);

	if (log) std::cout << "SA samples: " << result.samples.num_samples() << " (rate " << rate << "), text starts: " << result.samples.num_text_starts() << std::endl;

	return result;

}

}
