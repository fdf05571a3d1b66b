#include "common/base64.hpp"
#include <boost/archive/iterators/base64_from_binary.hpp>
#include <boost/archive/iterators/binary_from_base64.hpp>
#include <boost/archive/iterators/dataflow_exception.hpp>
#include <boost/archive/iterators/transform_width.hpp>
#include <algorithm>
#include <stdexcept>

namespace codegrade {
using namespace std;
namespace it = boost::archive::iterators;

string base64_encode(const string &data) {
    using encoder = it::base64_from_binary<it::transform_width<string::const_iterator, 6, 8>>;
    string encoded(encoder(data.begin()), encoder(data.end()));
    encoded.append((3 - data.size() % 3) % 3, '=');
    return encoded;
}

string base64_decode(const string &data) {
    using decoder = it::transform_width<it::binary_from_base64<string::const_iterator>, 8, 6>;
    string input = data;
    while (input.size() % 4) input.push_back('=');

    size_t padding = 0;
    for (auto i = input.rbegin(); i != input.rend() && *i == '=' && padding < 2; ++i) ++padding;
    // binary_from_base64 rejects '=', the padded bits are dropped below
    replace(input.end() - padding, input.end(), '=', 'A');

    try {
        string decoded(decoder(input.begin()), decoder(input.end()));
        decoded.erase(decoded.end() - min(padding, decoded.size()), decoded.end());
        return decoded;
    } catch (it::dataflow_exception &e) {
        throw invalid_argument(string("invalid base64 input: ") + e.what());
    }
}

}  // namespace codegrade
