// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * packing.hpp
 *
 * Access policies for dense symbol buffers during construction. byte_packing
 * stores one symbol per byte, half_byte_packing two symbols per byte
 * (high half first), which requires all symbols to be smaller than 16.
 *
 */

#pragma once

#include <vector>

#include "definitions.hpp"

namespace fmdex{

struct byte_packing{

	static uchar get(const uchar* buf, ulint i){
		return buf[i];
	}

	static void set(uchar* buf, ulint i, uchar v){
		buf[i] = v;
	}

	// bytes needed for n symbols
	static ulint bytes(ulint n){
		return n;
	}

	// chunks handed to different threads must start at a multiple of this
	static constexpr ulint alignment = 1;

};

struct half_byte_packing{

	static uchar get(const uchar* buf, ulint i){
		uchar byte = buf[i/2];
		return i%2 == 0 ? byte >> 4 : byte & 0x0F;
	}

	static void set(uchar* buf, ulint i, uchar v){
		uchar& byte = buf[i/2];

		if(i%2 == 0)
			byte = uchar((v << 4) | (byte & 0x0F));
		else
			byte = uchar((byte & 0xF0) | (v & 0x0F));
	}

	static ulint bytes(ulint n){
		return (n+1)/2;
	}

	static constexpr ulint alignment = 2;

	/*
	 * packs the first n symbols of buf in place into its first bytes(n) bytes
	 */
	static void pack_in_place(uchar* buf, ulint n){

		for(ulint i=0;i<n/2;++i)
			buf[i] = uchar((buf[2*i] << 4) | (buf[2*i+1] & 0x0F));

		if(n%2 == 1)
			buf[n/2] = uchar(buf[n-1] << 4);

	}

};

}
