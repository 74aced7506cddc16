/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#ifndef cli_HelpMessage_hpp
#define cli_HelpMessage_hpp

#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <boost/program_options.hpp>


namespace cuvette {
namespace cli {

/**
 * Builder of the text printed by "cuvette help COMMAND":
 * usage line, description, options and any number of titled sections.
 */
class HelpMessage {
public:
    HelpMessage& setUsage(const std::string&);
    HelpMessage& setDescription(const std::string&);
    HelpMessage& setOptionsDescription(const boost::program_options::options_description&);
    HelpMessage& addSection(const std::string& title, const std::string& body);
    std::string str() const;

private:
    std::string usage;
    std::string description;
    std::string options;
    std::vector<std::pair<std::string, std::string>> sections;
};

std::ostream& operator<<(std::ostream&, const HelpMessage&);

}
}

#endif
