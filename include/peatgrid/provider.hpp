#pragma once

#include "peatgrid/algorithm.hpp"

#include <memory>
#include <string>
#include <vector>

namespace peatgrid {

    // The set of algorithms this library offers to a host, addressed by their ids.
    class Provider {
      public:
        Provider();

        std::string id() const { return "peatlandspatial"; }
        std::string name() const { return "Peatland spatial"; }

        const std::vector<std::unique_ptr<Algorithm>> &algorithms() const { return algorithms_; }

        // Returns nullptr for an unknown id.
        const Algorithm *find(const std::string &algorithm_id) const;

      private:
        std::vector<std::unique_ptr<Algorithm>> algorithms_;
    };

} // namespace peatgrid
