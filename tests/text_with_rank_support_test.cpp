#include <gtest/gtest.h>
#include <random>
#include "internal/text_with_rank_support.hpp"

using namespace fmdex;

std::vector<uchar> random_text(std::mt19937& gen, ulint n, ulint sigma) {
    std::uniform_int_distribution<uint32_t> symbol_distrib(0,sigma-1);
    std::vector<uchar> text(n);
    for (auto& c : text) c = uchar(symbol_distrib(gen));
    return text;
}

template <class block_t>
void check_against_naive(const std::vector<uchar>& text, ulint sigma, ulint superblock_size) {
    text_with_rank_support<block_t> rs(text.data(),text.size(),sigma,superblock_size);

    ASSERT_EQ(rs.size(),text.size());
    ASSERT_EQ(rs.alphabet_size(),sigma);

    std::vector<ulint> counts(sigma,0);
    for (ulint i=0; i<=text.size(); i++) {
        for (ulint c=0; c<sigma; c++) {
            ASSERT_EQ(rs.rank(uchar(c),i),counts[c]) << "symbol " << c << " position " << i;
        }
        if (i < text.size()) {
            ASSERT_EQ(rs.symbol_at(i),text[i]);
            counts[text[i]]++;
        }
    }
}

TEST(test_text_with_rank_support,small_alphabets_block64) {
    std::mt19937 gen(1);
    for (ulint sigma : {2,3,4,5,6,16,17}) {
        for (ulint superblock_size : {64,128,1024,65536}) {
            check_against_naive<block64>(random_text(gen,3000,sigma),sigma,superblock_size);
        }
    }
}

TEST(test_text_with_rank_support,small_alphabets_block512) {
    std::mt19937 gen(2);
    for (ulint sigma : {2,5,6,16}) {
        for (ulint superblock_size : {512,1024,65536}) {
            check_against_naive<block512>(random_text(gen,5000,sigma),sigma,superblock_size);
        }
    }
}

TEST(test_text_with_rank_support,large_alphabets) {
    std::mt19937 gen(3);
    check_against_naive<block64>(random_text(gen,2000,255),255,1024);
    check_against_naive<block512>(random_text(gen,2000,200),200,512);
}

TEST(test_text_with_rank_support,edge_lengths) {
    std::mt19937 gen(4);
    for (ulint n : {0,1,63,64,65,511,512,513}) {
        check_against_naive<block64>(random_text(gen,n,5),5,128);
        check_against_naive<block512>(random_text(gen,n,5),5,512);
    }
}

TEST(test_text_with_rank_support,many_superblocks) {
    std::mt19937 gen(5);
    // more than 2^16 symbols, so that the relative block counts overflow without superblocks
    std::vector<uchar> text = random_text(gen,200000,3);
    text_with_rank_support<block64> rs(text.data(),text.size(),3);

    std::vector<ulint> counts(3,0);
    for (ulint i=0; i<text.size(); i++) counts[text[i]]++;
    for (ulint c=0; c<3; c++) EXPECT_EQ(rs.rank(uchar(c),text.size()),counts[c]);
}

TEST(test_text_with_rank_support,half_byte_packed_input) {
    std::mt19937 gen(6);
    for (ulint n : {0,1,2,999,1000}) {
        std::vector<uchar> text = random_text(gen,n,16);
        std::vector<uchar> packed = text;
        half_byte_packing::pack_in_place(packed.data(),n);

        text_with_rank_support<block64> plain(text.data(),n,16,128);
        text_with_rank_support<block64> from_packed(packed.data(),n,16,128,half_byte_packing());

        for (ulint i=0; i<=n; i++) {
            for (ulint c=0; c<16; c++) {
                ASSERT_EQ(plain.rank(uchar(c),i),from_packed.rank(uchar(c),i));
            }
        }
    }
}

TEST(test_text_with_rank_support,rank_many_equals_rank) {
    std::mt19937 gen(7);
    std::vector<uchar> text = random_text(gen,10000,6);
    text_with_rank_support<block512> rs(text.data(),text.size(),6,1024);

    std::uniform_int_distribution<ulint> pos_distrib(0,text.size());
    std::uniform_int_distribution<uint32_t> symbol_distrib(0,5);
    std::vector<std::pair<uchar,ulint>> queries;
    for (uint32_t q=0; q<5000; q++) queries.emplace_back(uchar(symbol_distrib(gen)),pos_distrib(gen));

    std::vector<ulint> results = rs.rank_many(queries);
    ASSERT_EQ(results.size(),queries.size());
    for (ulint q=0; q<queries.size(); q++) {
        EXPECT_EQ(results[q],rs.rank(queries[q].first,queries[q].second));
    }
}

TEST(test_text_with_rank_support,out_of_range) {
    std::vector<uchar> text = {1,2,3,0,4};
    text_with_rank_support<block64> rs(text.data(),text.size(),5,64);

    EXPECT_EQ(rs.rank(4,5),1);
    EXPECT_THROW(rs.rank(4,6),std::out_of_range);
    EXPECT_THROW(rs.rank(5,0),std::out_of_range);
    EXPECT_THROW(rs.symbol_at(5),std::out_of_range);
    EXPECT_THROW(rs.rank_many({{1,2},{1,7}}),std::out_of_range);
}

TEST(test_text_with_rank_support,invalid_superblock_size) {
    std::vector<uchar> text = {1,2,3,0,4};
    EXPECT_THROW(text_with_rank_support<block64>(text.data(),text.size(),5,100),configuration_error);
    EXPECT_THROW(text_with_rank_support<block512>(text.data(),text.size(),5,256),configuration_error);
    EXPECT_THROW(text_with_rank_support<block64>(text.data(),text.size(),5,65536*2),configuration_error);
}

TEST(test_text_with_rank_support,serialization) {
    std::mt19937 gen(8);
    std::vector<uchar> text = random_text(gen,5000,5);
    text_with_rank_support<block64> rs(text.data(),text.size(),5,256);

    std::stringstream ss;
    rs.serialize(ss);
    text_with_rank_support<block64> loaded;
    loaded.load(ss);

    ASSERT_EQ(loaded.size(),rs.size());
    for (ulint i=0; i<=text.size(); i+=7) {
        for (ulint c=0; c<5; c++) EXPECT_EQ(loaded.rank(uchar(c),i),rs.rank(uchar(c),i));
    }
}
