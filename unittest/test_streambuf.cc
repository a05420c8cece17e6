//
// Using a buffered_stream through the iostream library
//

#include <doctest/doctest.h>
#include <rstream/buffered_streambuf.hh>
#include <iterator>
#include <string>
#include "test_utils.hh"

using namespace rstream;

TEST_CASE("buffered_istream - formatted and unformatted input") {
    buffered_stream s(chunk_source::from_chunks(make_chunks({"hel", "lo wo", "rld\nsecond line\n"})));
    buffered_istream in(s);

    std::string word;
    in >> word;
    CHECK(word == "hello");

    std::string line;
    std::getline(in, line);
    CHECK(line == " world");
    std::getline(in, line);
    CHECK(line == "second line");

    CHECK_FALSE(static_cast<bool>(std::getline(in, line)));
    CHECK(in.eof());
}

TEST_CASE("buffered_istream - whole contents") {
    buffered_stream s(chunk_source::from_chunks(make_chunks({"abc", "", "def", "g"})));
    buffered_istream in(s);

    std::string all((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    CHECK(all == "abcdefg");
}

TEST_CASE("buffered_istream - seeking") {
    std::shared_ptr<pull_stats> stats;
    buffered_stream s(counted({"hello", " ", "world"}, stats));
    buffered_istream in(s);

    SUBCASE("seekg to end reports the length") {
        in.seekg(0, std::ios::end);
        CHECK(in.tellg() == std::streampos(11));
        CHECK(stats->exhausted);
    }

    SUBCASE("Absolute seek then read") {
        in.seekg(6);
        char buf[5];
        in.read(buf, 5);
        CHECK(in.gcount() == 5);
        CHECK(std::string(buf, 5) == "world");
    }

    SUBCASE("Relative seek") {
        in.seekg(2);
        in.seekg(3, std::ios::cur);
        CHECK(in.get() == ' ');
        in.seekg(-2, std::ios::cur);
        CHECK(in.get() == 'o');
    }

    SUBCASE("Negative position fails the stream") {
        in.seekg(-1, std::ios::beg);
        CHECK(in.fail());
        in.clear();
        CHECK(in.tellg() == std::streampos(0));
    }

    SUBCASE("Peeked character does not shift tellg") {
        CHECK(in.get() == 'h');
        CHECK(in.get() == 'e');
        CHECK(in.peek() == 'l');
        CHECK(in.tellg() == std::streampos(2));
        CHECK(in.get() == 'l');
        CHECK(in.tellg() == std::streampos(3));
    }
}

TEST_CASE("buffered_istream - putting bytes back") {
    buffered_stream s(chunk_source::from_chunks(make_chunks({"hello", "world"})));
    buffered_istream in(s);

    SUBCASE("unget after a bulk read returns the last byte read") {
        CHECK(in.get() == 'h');
        char buf[3];
        in.read(buf, 3);
        CHECK(std::string(buf, 3) == "ell");

        in.unget();
        CHECK(in.good());
        CHECK(in.tellg() == std::streampos(3));
        CHECK(in.get() == 'l');
        CHECK(in.get() == 'o');
    }

    SUBCASE("unget after seekg") {
        in.seekg(6);
        in.unget();
        CHECK(in.good());
        CHECK(in.tellg() == std::streampos(5));
        CHECK(in.get() == 'w');
    }

    SUBCASE("putback of the matching character") {
        in.seekg(3);
        in.putback('l');
        CHECK(in.good());
        CHECK(in.get() == 'l');
        CHECK(in.get() == 'l');
    }

    SUBCASE("putback of a different character fails") {
        in.seekg(3);
        in.putback('x');
        CHECK(in.bad());
        in.clear();
        CHECK(in.tellg() == std::streampos(3));
        CHECK(in.get() == 'l');
    }

    SUBCASE("unget at the start fails") {
        in.unget();
        CHECK(in.bad());
        in.clear();
        CHECK(in.get() == 'h');
    }
}

TEST_CASE("buffered_streambuf - available bytes") {
    buffered_stream s(chunk_source::from_chunks(make_chunks({"hello", "world"})));
    buffered_streambuf buf(s);

    CHECK(buf.in_avail() == 0);

    buf.pubseekoff(0, std::ios::end, std::ios::in);
    buf.pubseekpos(0, std::ios::in);
    CHECK(buf.in_avail() == 10);

    char tmp[10];
    CHECK(buf.sgetn(tmp, 10) == 10);
    CHECK(buf.in_avail() == -1);
}

TEST_CASE("buffered_streambuf - output side is refused") {
    buffered_stream s(chunk_source::from_chunks(make_chunks({"hello"})));
    buffered_streambuf buf(s);

    CHECK(buf.pubseekoff(0, std::ios::beg, std::ios::out) == std::streampos(std::streamoff(-1)));
    CHECK(buf.sputc('x') == std::char_traits<char>::eof());
}
