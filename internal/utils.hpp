// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

#pragma once

#include <algorithm>
#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "definitions.hpp"

namespace fmdex{

inline std::string get_time(uint64_t time){

	std::stringstream ss;

	if(time>=3600){

		uint64_t h = time/3600;
		uint64_t m = (time%3600)/60;
		uint64_t s = (time%3600)%60;

		ss  << time << " seconds. ("<< h << "h " << m << "m " << s << "s" << ")";

	}else if (time>=60){

		uint64_t m = time/60;
		uint64_t s = time%60;

		ss << time << " seconds. ("<< m << "m " << s << "s" << ")";

	}else{

		ss << time << " seconds.";

	}

	return ss.str();

}

inline uint8_t char_to_uchar(char c) {
	return *reinterpret_cast<uint8_t*>(&c);
}

inline char uchar_to_char(uint8_t c) {
	return *reinterpret_cast<char*>(&c);
}

// number of bits needed to write x (at least 1)
inline uint8_t bitsize(uint64_t x){

	if(x==0) return 1;
	return 64 - __builtin_clzll(x);

}

// ceil(log2(x)) for x > 0
inline ulint ilog2_ceil(ulint x){

	if(x<=1) return 0;
	return 64 - __builtin_clzll(x-1);

}

inline ulint div_ceil(ulint a, ulint b){
	return (a+b-1)/b;
}

inline std::chrono::steady_clock::time_point now() {
	return std::chrono::steady_clock::now();
}

inline std::string format_time(uint64_t ns) {
	std::string time_str;

	if (ns > 10000000000) {
		time_str = std::to_string(ns/1000000000) + " s";
	} else if (ns > 10000000) {
		time_str = std::to_string(ns/1000000) + " ms";
	} else if (ns > 10000) {
		time_str = std::to_string(ns/1000) + " us";
	} else {
		time_str = std::to_string(ns) + " ns";
	}

	return time_str;
}

inline uint64_t time_diff_ns(std::chrono::steady_clock::time_point t1, std::chrono::steady_clock::time_point t2) {
	return std::chrono::duration_cast<std::chrono::nanoseconds>(t2-t1).count();
}

inline std::chrono::steady_clock::time_point log_runtime(std::chrono::steady_clock::time_point t1, std::chrono::steady_clock::time_point t2) {
	std::cout << ", in ~ " << format_time(time_diff_ns(t1,t2)) << std::endl;
	return std::chrono::steady_clock::now();
}

inline std::chrono::steady_clock::time_point log_runtime(std::chrono::steady_clock::time_point t) {
	return log_runtime(t,std::chrono::steady_clock::now());
}

inline std::string format_size(uint64_t B) {
	std::string size_str;

	if (B > 10000000000) {
		size_str = std::to_string(B/1000000000) + " GB";
	} else if (B > 10000000) {
		size_str = std::to_string(B/1000000) + " MB";
	} else if (B > 10000) {
		size_str = std::to_string(B/1000) + " KB";
	} else {
		size_str = std::to_string(B) + " B";
	}

	return size_str;
}

/*
 * raw writes/reads of trivially copyable values, used by the serialize/load
 * functions of the index components
 */
template <typename T>
ulint write_value(std::ostream& out, const T& v){
	out.write((char*)&v,sizeof(T));
	return sizeof(T);
}

template <typename T>
void read_value(std::istream& in, T& v){
	if(!in.read((char*)&v,sizeof(T)))
		throw std::runtime_error("unexpected end of index data");
}

template <typename T>
ulint write_vector(std::ostream& out, const std::vector<T>& v){
	ulint n = v.size();
	out.write((char*)&n,sizeof(ulint));
	out.write((char*)v.data(),n*sizeof(T));
	return sizeof(ulint) + n*sizeof(T);
}

template <typename T>
void read_vector(std::istream& in, std::vector<T>& v){
	ulint n = 0;
	read_value(in,n);
	v.resize(n);
	if(!in.read((char*)v.data(),n*sizeof(T)))
		throw std::runtime_error("unexpected end of index data");
}

}
