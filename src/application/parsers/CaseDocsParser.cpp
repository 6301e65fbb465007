/**
 * @file CaseDocsParser.cpp
 * @brief Implementation of CaseDocsParser using pugixml.
 */

#include "application/parsers/CaseDocsParser.hpp"
#include "application/parsers/TextScan.hpp"
#include "infrastructure/TextFileReader.hpp"
#include <pugixml.hpp>

namespace simboard::application::parsers {

using domain::FieldMap;

CaseDocsParser::CaseDocsParser(std::shared_ptr<spdlog::logger> logger)
    : m_logger(std::move(logger)) {}

FieldMap CaseDocsParser::parseEnvCase(const std::filesystem::path& path) const {
    const std::string xml = infrastructure::TextFileReader::ReadText(path);
    return {{"group_name", findEntryValue(xml, "CASE_GROUP")}};
}

FieldMap CaseDocsParser::parseEnvBuild(const std::filesystem::path& path) const {
    const std::string xml = infrastructure::TextFileReader::ReadText(path);
    return {
        {"compiler", findEntryValue(xml, "COMPILER")},
        {"mpilib", findEntryValue(xml, "MPILIB")},
    };
}

std::optional<std::string> CaseDocsParser::findEntryValue(const std::string& xml, const std::string& entryId) const {
    pugi::xml_document doc;
    pugi::xml_parse_result parsed = doc.load_string(xml.c_str());
    if (!parsed) {
        m_logger->warn("Malformed case docs XML at offset {}: {}", parsed.offset, parsed.description());
        return std::nullopt;
    }

    for (const pugi::xpath_node& node : doc.select_nodes("//entry")) {
        pugi::xml_node entry = node.node();
        if (entryId != entry.attribute("id").value()) {
            continue;
        }
        if (pugi::xml_attribute value = entry.attribute("value")) {
            return std::string(value.value());
        }
        std::string text = Trim(entry.child_value());
        if (!text.empty()) {
            return text;
        }
    }
    return std::nullopt;
}

} // namespace simboard::application::parsers
