/*
 * Cuvette
 *
 * Copyright (c) 2018-2023, ETH Zurich. All rights reserved.
 *
 * Please, refer to the LICENSE file in the root directory.
 * SPDX-License-Identifier: BSD-3-Clause
 *
 */

#include "HelpMessage.hpp"

#include <sstream>

#include <boost/algorithm/string.hpp>


namespace cuvette {
namespace cli {

HelpMessage& HelpMessage::setUsage(const std::string& usage) {
    this->usage = usage;
    return *this;
}

HelpMessage& HelpMessage::setDescription(const std::string& description) {
    this->description = description;
    return *this;
}

HelpMessage& HelpMessage::setOptionsDescription(const boost::program_options::options_description& optionsDescription) {
    // options_description is not copyable, keep its rendered text
    std::ostringstream os;
    os << optionsDescription;
    options = os.str();
    return *this;
}

HelpMessage& HelpMessage::addSection(const std::string& title, const std::string& body) {
    sections.emplace_back(title, body);
    return *this;
}

static std::string indent(const std::string& text) {
    auto lines = std::vector<std::string>{};
    boost::split(lines, text, boost::is_any_of("\n"));
    std::ostringstream os;
    for(const auto& line : lines) {
        os << "  " << line << "\n";
    }
    return os.str();
}

std::string HelpMessage::str() const {
    std::ostringstream os;
    os << "Usage: " << usage << "\n"
       << "\n"
       << description << "\n";
    if(!options.empty()) {
        os << "\n" << options;
    }
    for(const auto& section : sections) {
        os << "\n" << section.first << ":\n" << indent(section.second);
    }
    return os.str();
}

std::ostream& operator<<(std::ostream& os, const HelpMessage& message) {
    return os << message.str();
}

}
}
