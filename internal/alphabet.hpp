// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

/*
 * alphabet.hpp
 *
 * Mapping of IO bytes (as they appear in texts and queries) to dense ranks.
 * Rank 0 is the sentinel and is never produced from an IO byte.
 *
 */

#pragma once

#include <array>
#include <iostream>
#include <string>
#include <vector>

#include "definitions.hpp"
#include "utils.hpp"

namespace fmdex{

class alphabet{

public:

	// marks IO bytes that are not part of the alphabet
	static constexpr uchar INVALID = 255;

	static constexpr uchar SENTINEL = 0;

	alphabet(){
		M_Sigma.fill(INVALID);
	}

	/*
	 * every byte of symbols gets its own rank, in the given order, starting at 1.
	 * The last num_not_searched symbols can occur in texts but are not
	 * enumerated by the lookup table (e.g. N in DNA)
	 */
	static alphabet from_io_symbols(const std::string& symbols, ulint num_not_searched){

		std::vector<std::string> groups;

		for(auto c : symbols)
			groups.push_back(std::string(1,c));

		return from_ambiguous_io_symbols(groups,num_not_searched);

	}

	/*
	 * every group of bytes shares one rank, e.g. {"Aa","Cc"}
	 */
	static alphabet from_ambiguous_io_symbols(const std::vector<std::string>& groups, ulint num_not_searched){

		if(groups.empty())
			throw configuration_error("alphabet needs at least one symbol");

		if(groups.size() >= INVALID)
			throw configuration_error("alphabet has too many symbols: " + std::to_string(groups.size()));

		if(num_not_searched >= groups.size())
			throw configuration_error("alphabet needs at least one searchable symbol");

		alphabet a;

		for(ulint r=0;r<groups.size();++r){

			for(auto c : groups[r]){

				if(a.M_Sigma[char_to_uchar(c)] != INVALID)
					throw configuration_error(std::string("alphabet symbol defined twice: ") + c);

				a.M_Sigma[char_to_uchar(c)] = uchar(r+1);

			}

		}

		a.sigma = groups.size()+1;
		a.num_not_searched = num_not_searched;

		return a;

	}

	/*
	 * dense rank of an IO byte, or INVALID
	 */
	uchar to_dense(uchar c) const {
		return M_Sigma[c];
	}

	bool contains(uchar c) const {
		return M_Sigma[c] != INVALID;
	}

	/*
	 * number of dense symbols, sentinel included
	 */
	ulint size() const {
		return sigma;
	}

	ulint num_searchable_symbols() const {
		return sigma - 1 - num_not_searched;
	}

	bool is_searchable(uchar dense) const {
		return dense != SENTINEL && dense <= num_searchable_symbols();
	}

	bool operator==(const alphabet& other) const {
		return sigma == other.sigma && num_not_searched == other.num_not_searched && M_Sigma == other.M_Sigma;
	}

	ulint serialize(std::ostream& out) const {

		ulint w_bytes = 0;

		w_bytes += write_value(out,sigma);
		w_bytes += write_value(out,num_not_searched);

		out.write((char*)M_Sigma.data(),256);
		w_bytes += 256;

		return w_bytes;

	}

	void load(std::istream& in){

		read_value(in,sigma);
		read_value(in,num_not_searched);

		in.read((char*)M_Sigma.data(),256);

	}

private:

	ulint sigma = 0;
	ulint num_not_searched = 0;

	std::array<uchar,256> M_Sigma;

};

/*
 * case-insensitive A,C,G,T
 */
inline alphabet ascii_dna(){
	return alphabet::from_ambiguous_io_symbols({"Aa","Cc","Gg","Tt"},0);
}

/*
 * case-insensitive A,C,G,T,N where N is not searched
 */
inline alphabet ascii_dna_with_n(){
	return alphabet::from_ambiguous_io_symbols({"Aa","Cc","Gg","Tt","Nn"},1);
}

/*
 * all IUPAC nucleotide codes, each its own symbol
 */
inline alphabet ascii_dna_iupac(){
	return alphabet::from_ambiguous_io_symbols(
		{"Aa","Cc","Gg","Tt","Nn","Rr","Yy","Kk","Mm","Ss","Ww","Bb","Dd","Hh","Vv"},0);
}

/*
 * IUPAC codes collapsed onto one of A,C,G
 */
inline alphabet ascii_dna_iupac_as_dna(){
	return alphabet::from_ambiguous_io_symbols(
		{"AaRrMmWwDdHhVv","CcYySsBb","GgKk","Tt"},0);
}

/*
 * IUPAC codes collapsed onto N, N is not searched
 */
inline alphabet ascii_dna_iupac_as_dna_with_n(){
	return alphabet::from_ambiguous_io_symbols(
		{"Aa","Cc","Gg","Tt","NnRrYyKkMmSsWwBbDdHhVv"},1);
}

}
