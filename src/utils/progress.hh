#include <iomanip>
#include <iostream>

#ifndef UTIL_PROGRESS_HH_
#define UTIL_PROGRESS_HH_

////////////////////////////////////////////////////////////////
// e.g.,
//   progress_bar_t<Index> prog(ntot, 1e2);
//   for (...) { prog.update(); prog(std::cerr); }
////////////////////////////////////////////////////////////////

template <typename T>
struct progress_bar_t {

    explicit progress_bar_t(const T _total, const T _interval)
        : total(_total)
        , interval(_interval > 0 ? _interval : 1)
        , nsofar(0)
    {
    }

    void update() { ++nsofar; }

    void operator()(std::ostream &oss)
    {
        if (nsofar % interval != 0 && nsofar < total)
            return;

        const int pct = total > 0 ?
            static_cast<int>(100.0 * static_cast<double>(nsofar) / total) :
            100;

        oss << "\r" << std::setw(10) << nsofar << " / " << total << " ["
            << std::setw(3) << pct << "%]" << std::flush;

        if (nsofar >= total)
            oss << std::endl;
    }

    const T total;
    const T interval;

private:
    T nsofar;
};

#endif
