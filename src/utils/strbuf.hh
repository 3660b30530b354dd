#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

#ifndef STRBUF_T_HH_
#define STRBUF_T_HH_

////////////////////////////////////////////////////////////////
// Word buffer for the character-level readers in utils/io.hh
//
// "NA", "na", "NaN" and "nan" words read as NaN.
////////////////////////////////////////////////////////////////

struct strbuf_t {

    explicit strbuf_t() { data.reserve(64); }

    void add(const char c)
    {
        if (!std::isspace(static_cast<unsigned char>(c)))
            data.push_back(c);
    }

    std::size_t size() const { return data.size(); }

    void clear() { data.clear(); }

    const char *operator()() const { return data.c_str(); }

    /// false if the word is not a number as a whole
    bool take_float(float &val) const
    {
        if (is_data_na()) {
            val = NAN;
            return true;
        }
        if (data.empty())
            return false;
        char *end = nullptr;
        val = std::strtof(data.c_str(), &end);
        return end != nullptr && *end == '\0';
    }

    bool take_double(double &val) const
    {
        if (is_data_na()) {
            val = NAN;
            return true;
        }
        if (data.empty())
            return false;
        char *end = nullptr;
        val = std::strtod(data.c_str(), &end);
        return end != nullptr && *end == '\0';
    }

    bool take(float &val) const { return take_float(val); }
    bool take(double &val) const { return take_double(val); }

private:
    bool is_data_na() const
    {
        return data == "NA" || data == "na" || data == "NaN" || data == "nan";
    }

    std::string data;
};

#endif
