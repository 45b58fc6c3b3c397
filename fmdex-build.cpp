// Copyright (c) 2017, Nicola Prezza.  All rights reserved.
// Use of this source code is governed
// by a MIT license that can be found in the LICENSE file.

#include <iostream>
#include <limits>

#include "internal/fm_index.hpp"
#include "internal/utils.hpp"

using namespace fmdex;
using namespace std;

string out_basename=string();
string input_file=string();
fm_index_config config;
bool dna_only = false;

void help(){
	cout << "fmdex-build: builds the FM-index of a set of DNA texts. Extension .fmd is automatically added to output index file" << endl << endl;
	cout << "Usage: fmdex-build [options] <input_file_name>" << endl;
	cout << "   <input_file_name>    input file, one text per line (empty lines are empty texts)." << endl;
	cout << "   -o <basename>        use 'basename' as prefix for all index files. Default: basename is the specified input_file_name"<<endl;
	cout << "   -s <rate>            suffix array sampling rate. Default: " << config.sa_sampling_rate << endl;
	cout << "   -k <depth>           depth of the k-mer lookup table, 0 disables it. Default: " << config.lookup_table_depth << endl;
	cout << "   -t <threads>         number of threads used for construction. Default: all" << endl;
	cout << "   -low-memory          pack text and BWT into half bytes during construction" << endl;
	cout << "   -sais-lite           use sais-lite instead of libsais to build the suffix array" << endl;
	cout << "   -dna                 alphabet A,C,G,T (case insensitive). Default: A,C,G,T,N" << endl;
	exit(0);
}

ulint parse_number(char** argv, int argc, int &ptr, string option){

	if(ptr>=argc-1){
		cout << "Error: missing parameter after " << option << " option." << endl;
		help();
	}

	ulint value = 0;

	try{
		value = stoull(string(argv[ptr]));
	}catch(const std::logic_error&){
		cout << "Error: '" << argv[ptr] << "' after " << option << " is not a number." << endl;
		help();
	}

	ptr++;

	return value;

}

void parse_args(char** argv, int argc, int &ptr){

	string s(argv[ptr]);
	ptr++;

	if(s.compare("-o")==0){

		if(ptr>=argc-1){
			cout << "Error: missing parameter after -o option." << endl;
			help();
		}

		out_basename = string(argv[ptr]);
		ptr++;

	}else if(s.compare("-s")==0){

		config.sa_sampling_rate = parse_number(argv, argc, ptr, s);

	}else if(s.compare("-k")==0){

		config.lookup_table_depth = parse_number(argv, argc, ptr, s);

	}else if(s.compare("-t")==0){

		config.threads = int(parse_number(argv, argc, ptr, s));

	}else if(s.compare("-low-memory")==0){

		config.low_memory = true;

	}else if(s.compare("-sais-lite")==0){

		config.saca = saca_algorithm::sais_lite;

	}else if(s.compare("-dna")==0){

		dna_only = true;

	} else {
		cout << "Error: unrecognized '" << s << "' option." << endl;
		help();
	}

}

template<typename uint_t>
void build(const vector<string>& texts, const alphabet& alpha, std::chrono::steady_clock::time_point t1){

	auto idx = fm_index<uint_t>(texts, alpha, config);

	idx.save_to_file(out_basename);

	auto t2 = now();
	ulint time_ms = time_diff_ns(t1,t2)/1000000;
	cout << "Build time : " << get_time(time_ms/1000) << endl;

	cout << "RESULT"
		<< " algo=fmdex_build"
		<< " time_ms=" << time_ms
		<< " texts=" << idx.num_texts()
		<< " n=" << idx.size()
		<< " sa_rate=" << config.sa_sampling_rate
		<< " k=" << idx.lookup_table_depth()
		<< " idx_size=" << idx.size_in_bytes()
		<< endl;

}

int main(int argc, char** argv){

	auto t1 = now();

	//parse options

	int ptr = 1;

	if(argc<2) help();

	while(ptr<argc-1)
		parse_args(argv, argc, ptr);

	input_file = string(argv[ptr++]);

	if(out_basename.compare("")==0)
		out_basename = string(input_file);

	string idx_file = out_basename;
	idx_file.append(".fmd");

	cout << "Building FM-index of input file " << input_file << endl;
	cout << "Index will be saved to " << idx_file << endl;

	vector<string> texts;
	ulint n = 0;

	{

		std::ifstream fs(input_file);

		if(!fs){
			cout << "Error: cannot open " << input_file << endl;
			return 1;
		}

		string line;

		while(getline(fs,line)){

			if(!line.empty() && line.back() == '\r') line.pop_back();

			n += line.size()+1;
			texts.push_back(std::move(line));

		}

	}

	config.log = true;

	alphabet alpha = dna_only ? ascii_dna() : ascii_dna_with_n();

	try{

		// smallest offset type that fits the corpus
		if(n <= ulint(numeric_limits<int32_t>::max()))
			build<int32_t>(texts, alpha, t1);
		else if(n <= ulint(numeric_limits<uint32_t>::max()))
			build<uint32_t>(texts, alpha, t1);
		else
			build<int64_t>(texts, alpha, t1);

	}catch(const input_error& e){

		cout << "Error: " << e.what() << " (line " << e.text_id()+1 << " of " << input_file << ")" << endl;
		return 1;

	}catch(const std::exception& e){

		cout << "Error: " << e.what() << endl;
		return 1;

	}

}
