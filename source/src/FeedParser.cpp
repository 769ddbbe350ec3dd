#include "FeedParser.hpp"

#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

namespace pt = boost::property_tree;

namespace {

std::string text_of(const pt::ptree& node, const char* child) {
    return node.get<std::string>(child, "");
}

FeedEntry parse_rss_item(const pt::ptree& item) {
    FeedEntry entry;
    entry.title = text_of(item, "title");

    for (const auto& [name, child]: item) {
        if (name == "link") {
            entry.links.push_back({ child.get_value<std::string>(), "", "alternate" });
        }
        else if (name == "enclosure") {
            entry.links.push_back({
                child.get<std::string>("<xmlattr>.url", ""),
                child.get<std::string>("<xmlattr>.type", ""),
                "enclosure"
            });
        }
    }

    return entry;
}

FeedEntry parse_atom_entry(const pt::ptree& item) {
    FeedEntry entry;
    entry.title = text_of(item, "title");

    for (const auto& [name, child]: item) {
        if (name != "link") continue;

        entry.links.push_back({
            child.get<std::string>("<xmlattr>.href", ""),
            child.get<std::string>("<xmlattr>.type", ""),
            child.get<std::string>("<xmlattr>.rel", "alternate")
        });
    }

    return entry;
}

}

std::vector<FeedEntry> parse_feed(std::string_view document) {
    pt::ptree tree;

    try {
        std::istringstream in{ std::string(document) };
        pt::read_xml(in, tree, pt::xml_parser::trim_whitespace);
    }
    catch (const pt::xml_parser_error& e) {
        throw FeedParseError(std::string("Malformed feed: ") + e.what());
    }

    std::vector<FeedEntry> entries;

    if (auto rss = tree.get_child_optional("rss")) {
        auto channel = rss->get_child_optional("channel");
        if (!channel) throw FeedParseError("RSS document without a channel");

        for (const auto& [name, node]: *channel) {
            if (name == "item") entries.push_back(parse_rss_item(node));
        }
    }
    else if (auto rdf = tree.get_child_optional("rdf:RDF")) {
        // RSS 1.0 keeps items beside the channel
        for (const auto& [name, node]: *rdf) {
            if (name == "item") entries.push_back(parse_rss_item(node));
        }
    }
    else if (auto feed = tree.get_child_optional("feed")) {
        for (const auto& [name, node]: *feed) {
            if (name == "entry") entries.push_back(parse_atom_entry(node));
        }
    }
    else {
        throw FeedParseError("Unrecognized feed format");
    }

    return entries;
}

bool is_transfer_link(const FeedLink& link) {
    return link.type == "application/x-bittorrent" || link.href.starts_with("magnet:");
}
