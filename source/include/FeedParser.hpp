#pragma once

#include <string>
#include <vector>
#include <stdexcept>
#include <string_view>

class FeedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FeedParseError : public FeedError {
public:
    using FeedError::FeedError;
};

class FeedFetchError : public FeedError {
public:
    using FeedError::FeedError;
};

struct FeedLink {
    std::string href;
    std::string type;
    std::string rel;
};

struct FeedEntry {
    std::string title;
    std::vector<FeedLink> links;   // document order
};

// RSS 2.0, RSS 1.0 (RDF) and Atom; throws FeedParseError
std::vector<FeedEntry> parse_feed(std::string_view document);

// a .torrent enclosure or a magnet link
bool is_transfer_link(const FeedLink& link);
