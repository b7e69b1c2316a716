#pragma once

#include <fstream>
#include <sstream>
#include <string>

namespace aasx_kg {
namespace testing {

// Tests run from the build directory; fixtures live in the source tree.
// __FILE__ is this header, so test/helpers -> test/testdata.
inline std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto helpers_dir = this_file.substr(0, this_file.rfind('/'));      // .../test/helpers
    auto test_root = helpers_dir.substr(0, helpers_dir.rfind('/'));   // .../test
    return test_root + "/testdata/" + filename;
}

inline std::string LoadTestData(const std::string& filename) {
    std::ifstream in(TestDataPath(filename), std::ios::binary);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

} // namespace testing
} // namespace aasx_kg
