// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * suffix_array_construction.hpp
 *
 * The only place where a suffix array construction algorithm is called.
 * Everything else in the construction only sees the resulting suffix array.
 *
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <omp.h>
#include <libsais.h>
#include <libsais64.h>
#include <sais.hxx>

#include "definitions.hpp"

namespace fmdex{

enum class saca_algorithm{
	libsais,	// libsais, multithreaded when built with LIBSAIS_OPENMP
	sais_lite	// Yuta Mori's sais-lite, single threaded
};

inline std::string saca_name(saca_algorithm algo){
	return algo == saca_algorithm::libsais ? "libsais" : "sais-lite";
}

/*
 * value type of the suffix array the saca writes for an index with offset type uint_t.
 * libsais has no unsigned 32 bit variant, so uint32_t indexes go through 64 bits
 */
template<typename uint_t>
struct saca_value{
	using type = typename std::conditional<std::is_same_v<uint_t,int32_t>,int32_t,int64_t>::type;
};

template<typename uint_t>
using saca_value_t = typename saca_value<uint_t>::type;

/*
 * suffix array of text[0,n). text must consist of dense symbols smaller than sigma.
 * threads == 0 uses the OpenMP default.
 */
template<typename sa_t>
std::vector<sa_t> construct_suffix_array(const uchar* text, ulint n, ulint sigma, saca_algorithm algo, int threads){

	static_assert(std::is_same_v<sa_t,int32_t> || std::is_same_v<sa_t,int64_t>, "suffix array values must be int32_t or int64_t");

	std::vector<sa_t> SA(n);

	if(n == 0) return SA;

	if(threads <= 0) threads = omp_get_max_threads();

	int64_t ret = 0;

	if(algo == saca_algorithm::sais_lite){

		ret = saisxx(text, SA.data(), sa_t(n), sa_t(sigma));

	}else if constexpr (std::is_same_v<sa_t,int32_t>){

#if defined(LIBSAIS_OPENMP)
		ret = libsais_omp(text, SA.data(), int32_t(n), 0, nullptr, int32_t(threads));
#else
		ret = libsais(text, SA.data(), int32_t(n), 0, nullptr);
#endif

	}else{

#if defined(LIBSAIS_OPENMP)
		ret = libsais64_omp(text, SA.data(), int64_t(n), 0, nullptr, int64_t(threads));
#else
		ret = libsais64(text, SA.data(), int64_t(n), 0, nullptr);
#endif

	}

	if(ret != 0)
		throw std::runtime_error(saca_name(algo) + " failed with return code " + std::to_string(ret));

	return SA;

}

}
