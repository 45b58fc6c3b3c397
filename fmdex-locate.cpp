// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

#include <iostream>

#include <ips4o.hpp>

#include "internal/fm_index.hpp"
#include "internal/utils.hpp"

using namespace fmdex;
using namespace std;

bool count_only = false;
string index_file=string();
string patterns_file=string();

void help(){
	cout << "fmdex-locate: counts or locates all occurrences of a set of patterns" << endl << endl;
	cout << "Usage: fmdex-locate [options] <index file> <patterns file>" << endl;
	cout << "   -count               only count the occurrences." << endl;
	cout << "   <index file>         index file (with extension .fmd)." << endl;
	cout << "   <patterns file>      file with one pattern per line." << endl;
	cout << "Output: one line 'text_id<TAB>position' per occurrence (sorted per pattern) or 'count' per pattern," << endl;
	cout << "        '-' for patterns with symbols outside the alphabet." << endl;
	exit(0);
}

void parse_args(char** argv, int argc, int &ptr){

	string s(argv[ptr]);
	ptr++;

	if(s.compare("-count")==0){

		count_only = true;

	} else {
		cout << "Error: unrecognized '" << s << "' option." << endl;
		help();
	}

}

template<typename uint_t>
void run(const vector<string>& patterns){

	auto t1 = now();

	auto idx = fm_index<uint_t>();
	idx.load_from_file(index_file);

	auto t2 = now();
	cout << "Load time : " << format_time(time_diff_ns(t1,t2)) << endl;

	ulint occ = 0;
	ulint invalid = 0;

	auto search_start = now();

	if(count_only){

		auto counts = idx.count_many(patterns);

		for(auto& c : counts){

			if(!c){
				cout << "-" << endl;
				invalid++;
				continue;
			}

			cout << *c << endl;
			occ += *c;

		}

	}else{

		auto hits = idx.locate_many(patterns);

		for(ulint q=0;q<patterns.size();++q){

			cout << ">" << patterns[q] << endl;

			if(!hits[q]){
				cout << "-" << endl;
				invalid++;
				continue;
			}

			auto& H = *hits[q];
			ips4o::sort(H.begin(),H.end());

			for(auto& h : H)
				cout << h.text_id << "\t" << h.position << endl;

			occ += H.size();

		}

	}

	auto search_end = now();
	ulint time_ns = time_diff_ns(search_start,search_end);

	cout << "Searched " << patterns.size() << " patterns (" << invalid << " invalid), " << occ << " occurrences in " << format_time(time_ns) << endl;
	idx.log_data_structure_sizes();

	cout << "RESULT"
		<< " algo=" << (count_only ? "fmdex_count" : "fmdex_locate")
		<< " patterns=" << patterns.size()
		<< " invalid=" << invalid
		<< " occ=" << occ
		<< " time_ms=" << time_ns/1000000
		<< " n=" << idx.size()
		<< " idx_size=" << idx.size_in_bytes()
		<< endl;

}

int main(int argc, char** argv){

	int ptr = 1;

	if(argc<3) help();

	while(ptr<argc-2)
		parse_args(argv, argc, ptr);

	index_file = string(argv[ptr++]);
	patterns_file = string(argv[ptr++]);

	vector<string> patterns;

	{

		std::ifstream fs(patterns_file);

		if(!fs){
			cout << "Error: cannot open " << patterns_file << endl;
			return 1;
		}

		string line;

		while(getline(fs,line)){
			if(!line.empty() && line.back() == '\r') line.pop_back();
			patterns.push_back(std::move(line));
		}

	}

	try{

		uchar type_id = read_offset_type_id(index_file);

		if(type_id == fm_index<int32_t>::offset_type_id())
			run<int32_t>(patterns);
		else if(type_id == fm_index<uint32_t>::offset_type_id())
			run<uint32_t>(patterns);
		else if(type_id == fm_index<int64_t>::offset_type_id())
			run<int64_t>(patterns);
		else{
			cout << "Error: " << index_file << " has unknown offset type id " << ulint(type_id) << endl;
			return 1;
		}

	}catch(const std::exception& e){

		cout << "Error: " << e.what() << endl;
		return 1;

	}

}
