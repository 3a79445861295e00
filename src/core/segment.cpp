#include "betaorbit/segment.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace betaorbit {

const char* to_string(SequenceKind kind) {
    switch (kind) {
        case SequenceKind::Digit:   return "digits";
        case SequenceKind::Iterate: return "iterates";
    }
    return "unknown";
}

SegmentMetadata make_metadata(SequenceKind kind, const AlgebraicNumber& number,
                              Index start_n, Index length,
                              std::optional<Period> completion) {
    SegmentMetadata meta;
    meta.kind = kind;
    meta.min_poly = number.min_poly();
    meta.precision = number.precision();

    const int digits = static_cast<int>(std::ceil(number.precision() * std::log10(2.0))) + 1;
    std::ostringstream root;
    root << std::setprecision(digits) << number.root();
    meta.root = root.str();

    meta.start_n = start_n;
    meta.length = length;
    meta.completion = completion;
    return meta;
}

} // namespace betaorbit
