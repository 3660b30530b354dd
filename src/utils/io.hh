////////////////////////////////////////////////////////////////
// I/O routines
#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_stream.hpp>

#include <eigen3/Eigen/Core>

#include "utils/strbuf.hh"
#include "utils/util.hh"

#ifndef UTIL_IO_HH_
#define UTIL_IO_HH_

/////////////////////////////////
// common utility for data I/O //
/////////////////////////////////

inline bool
is_file_gz(const std::string filename)
{
    if (filename.size() < 3)
        return false;
    return filename.substr(filename.size() - 3) == ".gz";
}

/// read(istream &) on a plain or gzip-compressed file
template <typename Func>
int
read_stream_file(const std::string filename, Func &&read)
{
    std::ifstream file(filename.c_str(), std::ios::in | std::ios::binary);
    ERR_RET(!file.is_open(), "Failed to open " << filename);

    boost::iostreams::filtering_istream ifs;
    if (is_file_gz(filename))
        ifs.push(boost::iostreams::gzip_decompressor());
    ifs.push(file);

    try {
        return read(ifs);
    } catch (const boost::iostreams::gzip_error &e) {
        ELOG("Corrupt gzip stream in " << filename << ": " << e.what());
    }
    return EXIT_FAILURE;
}

/// write(ostream &) to a plain or gzip-compressed file
template <typename Func>
int
write_stream_file(const std::string filename, Func &&write)
{
    std::ofstream file(filename.c_str(), std::ios::out | std::ios::binary);
    ERR_RET(!file.is_open(), "Failed to open " << filename);

    int ret = EXIT_SUCCESS;
    {
        boost::iostreams::filtering_ostream ofs;
        if (is_file_gz(filename))
            ofs.push(boost::iostreams::gzip_compressor());
        ofs.push(file);
        ret = write(ofs);
        ofs.flush();
    } // the compressor writes its trailer here
    file.flush();

    ERR_RET(!file.good(), "Failed to write " << filename);
    return ret;
}

////////////////////////////////////////////////////////////////
// Dense matrix in a text file: one row per line, words separated
// by white space; every line must have the same number of words
////////////////////////////////////////////////////////////////

template <typename IFS, typename T>
int
read_data_stream(IFS &ifs, T &in)
{
    using elem_t = typename T::Scalar;

    typedef enum _state_t { S_WORD, S_EOW, S_EOL } state_t;
    const char eol = '\n';
    std::istreambuf_iterator<char> END;
    std::istreambuf_iterator<char> it(ifs);

    std::vector<elem_t> data;
    std::vector<elem_t> row;
    strbuf_t strbuf;
    state_t state = S_EOL;

    std::size_t nr = 0; // number of rows
    std::size_t nc = 0; // number of columns
    std::size_t nmissing = 0;

    auto take_word = [&]() {
        elem_t val;
        ERR_RET(!strbuf.take(val),
                "Not a number: \"" << strbuf() << "\" on line " << (nr + 1));
        if (!std::isfinite(val))
            ++nmissing;
        row.emplace_back(val);
        strbuf.clear();
        return EXIT_SUCCESS;
    };

    auto take_line = [&]() {
        if (row.empty()) // skip blank lines
            return EXIT_SUCCESS;
        if (nr == 0)
            nc = row.size();
        ERR_RET(row.size() != nc,
                "Line " << (nr + 1) << " has " << row.size()
                        << " words, expected " << nc);
        data.insert(data.end(), row.begin(), row.end());
        row.clear();
        ++nr;
        return EXIT_SUCCESS;
    };

    for (; it != END; ++it) {
        const char c = *it;

        if (c == eol) {
            if (state == S_WORD)
                CHK_ERR_RET(take_word(), "Failed to parse a word");
            CHK_ERR_RET(take_line(), "Failed to parse a line");
            state = S_EOL;
        } else if (std::isspace(static_cast<unsigned char>(c))) {
            if (state == S_WORD)
                CHK_ERR_RET(take_word(), "Failed to parse a word");
            state = S_EOW;
        } else {
            strbuf.add(c);
            state = S_WORD;
        }
    }

    // the last line may not end with a newline
    if (state == S_WORD)
        CHK_ERR_RET(take_word(), "Failed to parse a word");
    CHK_ERR_RET(take_line(), "Failed to parse a line");

    if (nmissing > 0)
        WLOG("Found " << nmissing << " missing values");

    ERR_RET(nr < 1 || nc < 1, "empty file");

    in = Eigen::Map<T>(data.data(), nc, nr);
    in.transposeInPlace();

    return EXIT_SUCCESS;
}

template <typename T>
int
read_data_file(const std::string filename, T &in)
{
    return read_stream_file(filename, [&in](std::istream &ifs) {
        return read_data_stream(ifs, in);
    });
}

template <typename OFS, typename Derived>
int
write_data_stream(OFS &ofs, const Eigen::MatrixBase<Derived> &out)
{
    using Scalar = typename Derived::Scalar;
    const Derived &M = out.derived();

    ofs << std::setprecision(std::numeric_limits<Scalar>::max_digits10);

    for (Eigen::Index r = 0; r < M.rows(); ++r) {
        if (M.cols() > 0)
            ofs << M.coeff(r, 0);
        for (Eigen::Index c = 1; c < M.cols(); ++c)
            ofs << " " << M.coeff(r, c);
        ofs << "\n";
    }
    return ofs.good() ? EXIT_SUCCESS : EXIT_FAILURE;
}

template <typename Derived>
int
write_data_file(const std::string filename,
                const Eigen::MatrixBase<Derived> &out)
{
    return write_stream_file(filename, [&out](std::ostream &ofs) {
        return write_data_stream(ofs, out);
    });
}

/// one word per line
template <typename T>
int
write_vector_file(const std::string filename, const std::vector<T> &out)
{
    return write_stream_file(filename, [&out](std::ostream &ofs) {
        for (const T &x : out)
            ofs << x << "\n";
        return ofs.good() ? EXIT_SUCCESS : EXIT_FAILURE;
    });
}

#endif
