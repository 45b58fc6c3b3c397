#include <algorithm>
#include <fstream>
#include <gtest/gtest.h>
#include <memory>
#include <omp.h>
#include <random>
#include <sstream>
#include <thread>
#include "internal/fm_index.hpp"

using namespace fmdex;

std::vector<hit> sorted_hits(std::vector<hit> hits) {
    std::sort(hits.begin(),hits.end());
    return hits;
}

std::vector<std::string> random_dna_texts(std::mt19937& gen, ulint num_texts, ulint max_length, const std::string& symbols) {
    std::uniform_int_distribution<ulint> length_distrib(0,max_length);
    std::uniform_int_distribution<ulint> symbol_distrib(0,symbols.size()-1);
    std::vector<std::string> texts(num_texts);
    for (auto& text : texts) {
        text.resize(length_distrib(gen));
        for (auto& c : text) c = symbols[symbol_distrib(gen)];
    }
    return texts;
}

// suffix array of the dense concatenation, by sorting all suffixes
std::vector<ulint> naive_suffix_array(const std::vector<std::string>& texts, const alphabet& alpha) {
    std::vector<uchar> text;
    for (auto& t : texts) {
        for (char c : t) text.push_back(alpha.to_dense(char_to_uchar(c)));
        text.push_back(alphabet::SENTINEL);
    }
    std::vector<ulint> SA(text.size());
    for (ulint i=0; i<SA.size(); i++) SA[i] = i;
    std::sort(SA.begin(),SA.end(),[&](ulint a, ulint b) {
        return std::lexicographical_compare(text.begin()+a,text.end(),text.begin()+b,text.end());
    });
    return SA;
}

TEST(test_alphabet,presets) {
    EXPECT_EQ(ascii_dna().size(),5);
    EXPECT_EQ(ascii_dna_with_n().size(),6);
    EXPECT_EQ(ascii_dna_iupac().size(),16);
    EXPECT_EQ(ascii_dna_iupac_as_dna().size(),5);
    EXPECT_EQ(ascii_dna_iupac_as_dna_with_n().size(),6);

    EXPECT_EQ(ascii_dna_with_n().num_searchable_symbols(),4);
    EXPECT_EQ(ascii_dna().num_searchable_symbols(),4);

    alphabet dna = ascii_dna();
    EXPECT_EQ(dna.to_dense('A'),dna.to_dense('a'));
    EXPECT_EQ(dna.to_dense('T'),4);
    EXPECT_FALSE(dna.contains('N'));
    EXPECT_FALSE(dna.contains(0));

    alphabet collapsed = ascii_dna_iupac_as_dna();
    EXPECT_EQ(collapsed.to_dense('R'),collapsed.to_dense('A'));
    EXPECT_EQ(collapsed.to_dense('y'),collapsed.to_dense('C'));

    alphabet collapsed_n = ascii_dna_iupac_as_dna_with_n();
    EXPECT_EQ(collapsed_n.to_dense('R'),collapsed_n.to_dense('N'));
    EXPECT_FALSE(collapsed_n.is_searchable(collapsed_n.to_dense('N')));
    EXPECT_TRUE(collapsed_n.is_searchable(collapsed_n.to_dense('G')));
}

TEST(test_alphabet,invalid_definitions) {
    EXPECT_THROW(alphabet::from_io_symbols("",0),configuration_error);
    EXPECT_THROW(alphabet::from_io_symbols("ACGA",0),configuration_error);
    EXPECT_THROW(alphabet::from_io_symbols("ACGT",4),configuration_error);
    EXPECT_THROW(alphabet::from_ambiguous_io_symbols({"Aa","aC"},0),configuration_error);
}

TEST(test_fm_index,two_texts_with_n) {
    std::vector<std::string> texts = {"aACGT","acGtn"};
    fm_index<> index(texts,ascii_dna_with_n());

    EXPECT_EQ(index.size(),12);
    EXPECT_EQ(index.num_texts(),2);
    EXPECT_EQ(index.count("GT"),2);

    std::vector<hit> expected = {hit{0,3},hit{1,2}};
    EXPECT_EQ(sorted_hits(index.locate_all("GT")),expected);

    std::vector<hit> iterated;
    for (hit h : index.locate("gt")) iterated.push_back(h);
    EXPECT_EQ(sorted_hits(iterated),expected);

    EXPECT_EQ(index.count("N"),1);
    EXPECT_EQ(index.count("TN"),1);
    EXPECT_EQ(index.count("AC"),2);
    EXPECT_EQ(index.count("ACGTA"),0);
}

TEST(test_fm_index,single_empty_text) {
    std::vector<std::string> texts = {""};
    fm_index<> index(texts,ascii_dna_with_n());

    EXPECT_EQ(index.size(),1);
    EXPECT_EQ(index.count("A"),0);
    EXPECT_EQ(index.count("ACGT"),0);
    EXPECT_EQ(index.count("ACGTACGTACGT"),0);
    EXPECT_TRUE(index.locate_all("A").empty());
    EXPECT_EQ(index.count(""),1);
}

TEST(test_fm_index,single_text) {
    std::vector<std::string> texts = {"cccaaagggttt"};
    fm_index_config config;
    config.lookup_table_depth = 2;
    fm_index<> index(texts,ascii_dna(),config);

    EXPECT_EQ(index.count("c"),3);
    EXPECT_EQ(index.count("ccc"),1);
    EXPECT_EQ(index.count("cccc"),0);
    EXPECT_EQ(index.count("aaaggg"),1);
    EXPECT_EQ(index.count("ta"),0);

    EXPECT_EQ(index.locate_all("aaaggg"),(std::vector<hit>{hit{0,3}}));
    EXPECT_EQ(sorted_hits(index.locate_all("gt")),(std::vector<hit>{hit{0,8}}));
    EXPECT_EQ(sorted_hits(index.locate_all("tt")),(std::vector<hit>{hit{0,9},hit{0,10}}));
}

TEST(test_fm_index,multiple_texts) {
    std::vector<std::string> texts = {"cccaaagggttt","gtgt","","ttgg"};
    fm_index<> index(texts,ascii_dna());

    std::vector<hit> expected = {hit{0,8},hit{1,0},hit{1,2}};
    EXPECT_EQ(sorted_hits(index.locate_all("gt")),expected);
    EXPECT_EQ(sorted_hits(index.locate_all("tg")),(std::vector<hit>{hit{1,1},hit{3,1}}));
    // occurrences never span two texts
    EXPECT_EQ(index.count("tttgtgt"),0);
    EXPECT_EQ(index.count("gtt"),1);
}

TEST(test_fm_index,query_longer_than_texts) {
    std::vector<std::string> texts = {"ACGT","GT"};
    fm_index<> index(texts,ascii_dna());
    EXPECT_EQ(index.count("ACGTACGT"),0);
    EXPECT_EQ(index.count("ACGTG"),0);
}

TEST(test_fm_index,empty_query) {
    std::vector<std::string> texts = {"ACGT","GT"};
    fm_index<> index(texts,ascii_dna());

    auto c = index.cursor_for_query("");
    EXPECT_EQ(c.get_interval(),(interval{0,8}));
    EXPECT_EQ(c.length(),0);
    EXPECT_EQ(index.cursor_empty().get_interval(),(interval{0,index.size()}));
}

TEST(test_fm_index,query_input_errors) {
    std::vector<std::string> texts = {"ACGT","ACGA"};
    fm_index<> index(texts,ascii_dna());

    try {
        index.count("ACXGT");
        FAIL() << "expected query_input_error";
    } catch (const query_input_error& e) {
        EXPECT_EQ(e.position(),2);
    }

    EXPECT_THROW(index.count(std::string("AC\0G",4)),query_input_error);
    EXPECT_THROW(index.locate_all("N"),query_input_error);

    auto c = index.cursor_empty();
    EXPECT_THROW(c.extend_left('x'),query_input_error);
    // the failed extension leaves the cursor untouched
    EXPECT_EQ(c.get_interval(),index.cursor_empty().get_interval());
}

TEST(test_fm_index,input_errors) {
    std::vector<std::string> texts = {"ACGT","ACXT"};

    try {
        fm_index<> index(texts,ascii_dna());
        FAIL() << "expected input_error";
    } catch (const input_error& e) {
        EXPECT_EQ(e.text_id(),1);
        EXPECT_EQ(e.position(),2);
    }

    std::vector<std::string> with_sentinel = {"ACGT",std::string("AC\0T",4)};
    EXPECT_THROW(fm_index<>(with_sentinel,ascii_dna()),input_error);

    std::vector<std::string> no_texts;
    EXPECT_THROW(fm_index<>(no_texts,ascii_dna()),input_error);
}

TEST(test_fm_index,configuration_errors) {
    std::vector<std::string> texts = {"ACGT"};
    fm_index_config config;

    config.sa_sampling_rate = 0;
    EXPECT_THROW((fm_index<>(texts,ascii_dna(),config)),configuration_error);

    config = fm_index_config();
    config.superblock_size = 100;
    EXPECT_THROW((fm_index<>(texts,ascii_dna(),config)),configuration_error);

    config = fm_index_config();
    config.superblock_size = 768;
    EXPECT_THROW((fm_index<int32_t,block512>(texts,ascii_dna(),config)),configuration_error);
    config.superblock_size = 65536*2;
    EXPECT_THROW((fm_index<>(texts,ascii_dna(),config)),configuration_error);

    config = fm_index_config();
    config.lookup_table_depth = 9;
    EXPECT_THROW((fm_index<>(texts,ascii_dna_iupac(),config)),configuration_error);

    config = fm_index_config();
    config.threads = -1;
    EXPECT_THROW((fm_index<>(texts,ascii_dna(),config)),configuration_error);

    EXPECT_THROW(validate_corpus_length<int32_t>(ulint(1) << 31),configuration_error);
    EXPECT_NO_THROW(validate_corpus_length<uint32_t>(ulint(1) << 31));
    EXPECT_THROW(validate_corpus_length<uint32_t>(ulint(1) << 32),configuration_error);
}

TEST(test_cursor,extend_left) {
    std::vector<std::string> texts = {"AaACGT","AacGtn","GTGTGT"};
    fm_index<> index(texts,ascii_dna_with_n());

    auto c = index.cursor_empty();
    c.extend_left('T');
    c.extend_left('G');
    EXPECT_EQ(c.count(),5);
    EXPECT_EQ(c.length(),2);
    EXPECT_EQ(c.get_interval(),index.cursor_for_query("GT").get_interval());

    // cursors are values: extending a copy leaves the original untouched
    auto branch = c;
    branch.extend_left('C');
    EXPECT_EQ(branch.count(),2);
    EXPECT_EQ(c.count(),5);

    std::vector<hit> expected = {hit{0,3},hit{1,2}};
    EXPECT_EQ(sorted_hits(branch.locate().to_vector()),expected);

    auto other = c;
    other.extend_left('T');
    EXPECT_EQ(other.count(),2);
}

TEST(test_cursor,monotonicity_and_absorption) {
    std::mt19937 gen(11);
    std::vector<std::string> texts = random_dna_texts(gen,5,400,"ACGTN");
    fm_index<> index(texts,ascii_dna_with_n());

    std::string symbols = "ACGTN";
    std::uniform_int_distribution<ulint> symbol_distrib(0,symbols.size()-1);

    for (ulint round=0; round<100; round++) {
        auto c = index.cursor_empty();
        bool was_empty = false;
        for (ulint step=0; step<30; step++) {
            ulint before = c.count();
            interval before_interval = c.get_interval();
            c.extend_left(symbols[symbol_distrib(gen)]);
            EXPECT_LE(c.count(),before);
            if (was_empty) {
                EXPECT_TRUE(c.empty());
                EXPECT_EQ(c.get_interval(),before_interval);
            }
            was_empty = c.empty();
        }
    }
}

TEST(test_lookup_table,consistent_with_backward_search) {
    std::mt19937 gen(12);
    std::vector<std::string> texts = random_dna_texts(gen,4,300,"ACGTN");
    fm_index_config config;
    config.lookup_table_depth = 3;
    fm_index<> index(texts,ascii_dna_with_n(),config);

    ASSERT_EQ(index.lookup_table_depth(),3);

    std::string symbols = "ACGT";
    for (char a : symbols) for (char b : symbols) for (char c : symbols) {
        std::string kmer = {a,b,c};

        auto cursor = index.cursor_empty();
        for (ulint j=kmer.size(); j>0; j--) cursor.extend_left(kmer[j-1]);

        EXPECT_EQ(index.lookup_interval(kmer),cursor.get_interval()) << kmer;
    }

    EXPECT_THROW(index.lookup_interval("AC"),std::invalid_argument);
    EXPECT_THROW(index.lookup_interval("ACN"),std::invalid_argument);
}

TEST(test_lookup_table,queries_with_not_searched_symbols) {
    std::mt19937 gen(13);
    std::vector<std::string> texts = random_dna_texts(gen,3,2000,"ACGTNN");
    fm_index_config config;
    config.lookup_table_depth = 4;
    fm_index<> with_table(texts,ascii_dna_with_n(),config);
    config.lookup_table_depth = 0;
    fm_index<> without_table(texts,ascii_dna_with_n(),config);

    for (std::string q : {"N","NN","ACGN","NACG","ACNGT","ACGTA","GNNA","A","AC","ACG","ACGTACGT"}) {
        EXPECT_EQ(with_table.cursor_for_query(q).get_interval(),without_table.cursor_for_query(q).get_interval()) << q;
        EXPECT_EQ(with_table.cursor_for_query(q).length(),q.size());
    }
}

TEST(test_sampled_suffix_array,resolve_matches_full_suffix_array) {
    std::mt19937 gen(14);
    std::vector<std::string> texts = random_dna_texts(gen,4,150,"ACGTN");
    texts.push_back("");
    texts.push_back("A");

    std::vector<ulint> SA = naive_suffix_array(texts,ascii_dna_with_n());

    for (ulint rate : {1,2,3,5,8,32}) {
        fm_index_config config;
        config.sa_sampling_rate = rate;
        fm_index<> index(texts,ascii_dna_with_n(),config);

        ASSERT_EQ(index.size(),SA.size());
        for (ulint i=0; i<SA.size(); i++) {
            EXPECT_EQ(index.resolve(i),SA[i]) << "rate " << rate << " position " << i;
        }
        EXPECT_THROW(index.resolve(SA.size()),std::out_of_range);
    }
}

TEST(test_batched_search,equals_single_queries) {
    std::mt19937 gen(15);
    std::vector<std::string> texts = random_dna_texts(gen,6,1000,"ACGTN");
    fm_index_config config;
    config.lookup_table_depth = 3;
    fm_index<> index(texts,ascii_dna_with_n(),config);

    // different lengths, so that queries finish in different rounds
    std::vector<std::string> queries;
    std::uniform_int_distribution<ulint> text_distrib(0,texts.size()-1);
    std::uniform_int_distribution<ulint> length_distrib(0,15);
    for (ulint q=0; q<300; q++) {
        const std::string& t = texts[text_distrib(gen)];
        ulint len = std::min<ulint>(length_distrib(gen),t.size());
        std::uniform_int_distribution<ulint> pos_distrib(0,t.size()-len);
        queries.push_back(t.substr(pos_distrib(gen),len));
        if (q % 17 == 0) queries.push_back("ACXGT");
        if (q % 23 == 0) queries.push_back("ACGTACGTACGTACGTACGT");
    }

    auto counts = index.count_many(queries);
    auto hits = index.locate_many(queries);
    auto cursors = index.cursors_for_queries(queries);

    ASSERT_EQ(counts.size(),queries.size());
    ASSERT_EQ(hits.size(),queries.size());
    ASSERT_EQ(cursors.size(),queries.size());

    for (ulint q=0; q<queries.size(); q++) {
        if (queries[q] == "ACXGT") {
            EXPECT_FALSE(counts[q].has_value());
            EXPECT_FALSE(hits[q].has_value());
            EXPECT_FALSE(cursors[q].has_value());
            continue;
        }

        auto single = index.cursor_for_query(queries[q]);
        ASSERT_TRUE(counts[q].has_value());
        ASSERT_TRUE(hits[q].has_value());
        ASSERT_TRUE(cursors[q].has_value());

        EXPECT_EQ(*counts[q],single.count());
        EXPECT_EQ(cursors[q]->get_interval(),single.get_interval());
        EXPECT_EQ(cursors[q]->length(),single.length());
        EXPECT_EQ(*hits[q],single.locate().to_vector());
    }

    EXPECT_TRUE(index.count_many({}).empty());
}

TEST(test_fm_index,construction_variants_agree) {
    std::mt19937 gen(16);
    std::vector<std::string> texts = random_dna_texts(gen,5,3000,"ACGTN");

    fm_index_config config;
    config.superblock_size = 1024;
    fm_index<> reference(texts,ascii_dna_with_n(),config);

    fm_index_config low_memory = config;
    low_memory.low_memory = true;
    fm_index<> packed(texts,ascii_dna_with_n(),low_memory);

    fm_index_config sais_lite = config;
    sais_lite.saca = saca_algorithm::sais_lite;
    fm_index<int64_t,block512> other(texts,ascii_dna_with_n(),sais_lite);

    fm_index<uint32_t> wide(texts,ascii_dna_with_n(),config);

    std::uniform_int_distribution<ulint> pos_distrib(0,2000);
    for (ulint q=0; q<200; q++) {
        std::string query = texts[q%texts.size()].substr(std::min<ulint>(pos_distrib(gen),texts[q%texts.size()].size()),q%12);
        auto expected = sorted_hits(reference.locate_all(query));
        EXPECT_EQ(sorted_hits(packed.locate_all(query)),expected);
        EXPECT_EQ(sorted_hits(other.locate_all(query)),expected);
        EXPECT_EQ(sorted_hits(wide.locate_all(query)),expected);
    }

    for (ulint i=0; i<reference.size(); i+=13) {
        EXPECT_EQ(packed.resolve(i),reference.resolve(i));
        EXPECT_EQ(other.resolve(i),reference.resolve(i));
    }
}

TEST(test_fm_index,serialization) {
    std::mt19937 gen(17);
    std::vector<std::string> texts = random_dna_texts(gen,3,1500,"ACGTN");
    fm_index_config config;
    config.sa_sampling_rate = 3;
    config.lookup_table_depth = 4;
    fm_index<> index(texts,ascii_dna_with_n(),config);

    std::stringstream ss;
    index.serialize(ss);

    fm_index<> loaded;
    loaded.load(ss);

    EXPECT_EQ(loaded.size(),index.size());
    EXPECT_EQ(loaded.num_texts(),index.num_texts());
    EXPECT_EQ(loaded.lookup_table_depth(),4);
    EXPECT_EQ(loaded.get_config().sa_sampling_rate,3);
    EXPECT_TRUE(loaded.get_alphabet() == index.get_alphabet());

    for (std::string q : {"A","ACG","GTNA","ACGTAC","TTTT",""}) {
        EXPECT_EQ(loaded.count(q),index.count(q));
        EXPECT_EQ(loaded.locate_all(q),index.locate_all(q));
    }

    std::string path_prefix = ::testing::TempDir() + "fmdex_serialization_test";
    index.save_to_file(path_prefix);
    fm_index<> from_file;
    from_file.load_from_file(path_prefix + ".fmd");
    EXPECT_EQ(from_file.locate_all("ACG"),index.locate_all("ACG"));
    EXPECT_EQ(read_offset_type_id(path_prefix + ".fmd"),fm_index<>::offset_type_id());

    // wrong offset type
    std::stringstream ss2;
    index.serialize(ss2);
    fm_index<int64_t> wrong_type;
    EXPECT_THROW(wrong_type.load(ss2),std::runtime_error);

    // wrong block size
    std::stringstream ss3;
    index.serialize(ss3);
    fm_index<int32_t,block512> wrong_block;
    EXPECT_THROW(wrong_block.load(ss3),std::runtime_error);

    // not an index
    std::stringstream garbage("this is not an index at all");
    fm_index<> not_loaded;
    EXPECT_THROW(not_loaded.load(garbage),std::runtime_error);

    // truncated
    std::stringstream full;
    index.serialize(full);
    std::stringstream truncated(full.str().substr(0,full.str().size()-1));
    fm_index<> truncated_index;
    EXPECT_THROW(truncated_index.load(truncated),std::runtime_error);
}

TEST(test_fm_index,concurrent_queries) {
    std::mt19937 gen(18);
    std::vector<std::string> texts = random_dna_texts(gen,4,2000,"ACGT");
    const fm_index<> index(texts,ascii_dna());

    std::vector<std::string> queries = {"A","AC","ACG","GT","TTA","CGTA","GGGG"};
    std::vector<ulint> expected;
    for (auto& q : queries) expected.push_back(index.count(q));

    std::vector<std::thread> threads;
    std::vector<int> ok(4,1);
    for (ulint t=0; t<4; t++) {
        threads.emplace_back([&,t]() {
            for (ulint round=0; round<50; round++)
                for (ulint q=0; q<queries.size(); q++)
                    if (index.count(queries[q]) != expected[q]) ok[t] = 0;
        });
    }
    for (auto& th : threads) th.join();
    for (ulint t=0; t<4; t++) EXPECT_EQ(ok[t],1);
}

TEST(test_fm_index,copies_are_independent) {
    std::mt19937 gen(19);
    std::vector<std::string> texts = random_dna_texts(gen,3,800,"ACGT");
    fm_index_config config;
    config.sa_sampling_rate = 7;

    auto original = std::make_unique<fm_index<>>(texts,ascii_dna(),config);
    std::vector<hit> expected = sorted_hits(original->locate_all("ACG"));
    ulint expected_resolve = original->resolve(original->size()/2);

    fm_index<> copy = *original;
    original.reset();

    EXPECT_EQ(sorted_hits(copy.locate_all("ACG")),expected);
    EXPECT_EQ(copy.resolve(copy.size()/2),expected_resolve);

    fm_index<> moved = std::move(copy);
    EXPECT_EQ(sorted_hits(moved.locate_all("ACG")),expected);
}

TEST(test_fm_index,lf_step) {
    std::mt19937 gen(20);
    std::vector<std::string> texts = random_dna_texts(gen,3,500,"ACGT");
    fm_index<> index(texts,ascii_dna());

    for (std::string q : {"","G","GT","ACG"}) {
        auto c = index.cursor_for_query(q);
        for (uchar dense=0; dense<index.get_alphabet().size(); dense++) {
            auto extended = c;
            extended.extend_left_dense(dense);
            EXPECT_EQ(index.lf_step(dense,c.get_interval()),extended.get_interval());
        }
    }

    EXPECT_THROW(index.lf_step(uchar(index.get_alphabet().size()),interval{0,1}),std::out_of_range);
    EXPECT_THROW(index.lf_step(1,interval{0,index.size()+1}),std::out_of_range);
    EXPECT_THROW(index.lf_step(1,interval{3,2}),std::out_of_range);
}

TEST(test_fm_index,lookup_table_depth_limit) {
    // a single searchable symbol, so the number of entries stays 1 at any depth
    alphabet single = alphabet::from_io_symbols("AN",1);
    std::vector<std::string> texts = {"AAAANAAA","AA"};
    fm_index_config config;

    config.lookup_table_depth = 1000000000000;
    EXPECT_THROW((fm_index<>(texts,single,config)),configuration_error);
    config.lookup_table_depth = MAX_LOOKUP_TABLE_DEPTH+1;
    EXPECT_THROW((fm_index<>(texts,single,config)),configuration_error);

    config.lookup_table_depth = MAX_LOOKUP_TABLE_DEPTH;
    fm_index<> index(texts,single,config);
    EXPECT_EQ(index.count("AA"),6);
    EXPECT_EQ(index.count("AAA"),3);
    EXPECT_EQ(index.count("ANA"),1);
}

TEST(test_fm_index,threads_setting_is_not_changed) {
    int before = omp_get_max_threads();
    omp_set_num_threads(3);

    std::mt19937 gen(21);
    std::vector<std::string> texts = random_dna_texts(gen,4,1000,"ACGT");
    fm_index_config config;
    config.threads = 1;
    fm_index<> single_threaded(texts,ascii_dna(),config);
    EXPECT_EQ(omp_get_max_threads(),3);

    config.threads = 2;
    fm_index<> two_threads(texts,ascii_dna(),config);
    EXPECT_EQ(omp_get_max_threads(),3);

    EXPECT_EQ(sorted_hits(single_threaded.locate_all("ACG")),sorted_hits(two_threads.locate_all("ACG")));

    omp_set_num_threads(before);
}

TEST(test_fm_index,index_file_version) {
    std::vector<std::string> texts = {"ACGT","GGT"};
    fm_index<> index(texts,ascii_dna());

    std::string path_prefix = ::testing::TempDir() + "fmdex_version_test";
    index.save_to_file(path_prefix);
    EXPECT_EQ(read_offset_type_id(path_prefix + ".fmd"),fm_index<>::offset_type_id());

    // the version follows the 8 byte magic number
    {
        std::fstream fs(path_prefix + ".fmd",std::ios::in | std::ios::out | std::ios::binary);
        uint32_t version = fm_index<>::VERSION+1;
        fs.seekp(8);
        fs.write((char*)&version,sizeof(version));
    }

    EXPECT_THROW(read_offset_type_id(path_prefix + ".fmd"),std::runtime_error);
    fm_index<> loaded;
    EXPECT_THROW(loaded.load_from_file(path_prefix + ".fmd"),std::runtime_error);
}

TEST(test_text_boundaries,offsets_to_hits) {
    // texts of length 3, 0 and 4
    text_boundaries boundaries(std::vector<ulint>{3,4,9});

    EXPECT_EQ(boundaries.num_texts(),3);
    EXPECT_EQ(boundaries.to_hit(0),(hit{0,0}));
    EXPECT_EQ(boundaries.to_hit(2),(hit{0,2}));
    EXPECT_EQ(boundaries.to_hit(3),(hit{0,3}));
    EXPECT_EQ(boundaries.to_hit(4),(hit{1,0}));
    EXPECT_EQ(boundaries.to_hit(5),(hit{2,0}));
    EXPECT_EQ(boundaries.to_hit(9),(hit{2,4}));
    EXPECT_THROW(boundaries.to_hit(10),std::out_of_range);

    text_boundaries copy = boundaries;
    text_boundaries moved = std::move(boundaries);
    EXPECT_EQ(copy.to_hit(7),(hit{2,2}));
    EXPECT_EQ(moved.to_hit(7),(hit{2,2}));

    std::stringstream ss;
    copy.serialize(ss);
    text_boundaries loaded;
    loaded.load(ss);
    EXPECT_EQ(loaded.num_texts(),3);
    EXPECT_EQ(loaded.to_hit(4),(hit{1,0}));
    EXPECT_EQ(loaded.to_hit(8),(hit{2,3}));
}
