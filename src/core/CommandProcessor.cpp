#include "CommandProcessor.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <optional>
#include <sstream>
#include <stdexcept>

#include "../utils/Utils.hpp"

namespace {
    const std::string NIL_REPLY = "(nil)";
    const std::string OK_REPLY = "OK";
    const std::string TTL_PREFIX = "ttl=";

    std::string errorReply(const std::string& reason) {
        return "ERR " + reason;
    }
}

CommandProcessor::CommandProcessor(std::shared_ptr<MemoryRepository> repository,
                                   std::shared_ptr<MemoryCache> cache,
                                   std::shared_ptr<ILogger> logger)
    : repository_(repository), cache_(cache), logger_(logger) {
    if (!repository_) {
        throw std::invalid_argument("Repository pointer cannot be null");
    }
    if (!cache_) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
}

std::string CommandProcessor::usage() {
    return "PUT <owner> <category> <key> [ttl=<seconds>] <json object>\n"
           "GET <owner> <category> <key>\n"
           "DEL <owner> <category> <key>\n"
           "CLEAR <owner>\n"
           "FLUSH\n"
           "SWEEP\n"
           "STATS\n"
           "DUMP [owner]\n"
           "QUIT";
}

std::string CommandProcessor::process(const std::string& line) {
    const std::string trimmed = Utils::trim(line);
    if (trimmed.empty()) {
        return errorReply("empty command");
    }

    std::vector<std::string> tokens = tokenize(trimmed);
    std::string command = tokens.front();
    std::transform(command.begin(), command.end(), command.begin(), [](unsigned char c) { return std::toupper(c); });

    try {
        if (command == "PUT") return handlePut(tokens, trimmed);
        if (command == "GET") return handleGet(tokens);
        if (command == "DEL") return handleDel(tokens);
        if (command == "CLEAR") return handleClear(tokens);
        if (command == "DUMP") return handleDump(tokens);
        if (command == "FLUSH") {
            cache_->clearAll();
            logger_->info("Cache flushed.");
            return OK_REPLY;
        }
        if (command == "SWEEP") {
            return std::to_string(cache_->cleanupExpired());
        }
        if (command == "STATS") {
            return cache_->getStats().toJson().dump();
        }
        if (command == "HELP") {
            return usage();
        }
        return errorReply("unknown command '" + tokens.front() + "'");
    } catch (const json::parse_error& e) {
        return errorReply(std::string("malformed JSON: ") + e.what());
    } catch (const std::invalid_argument& e) {
        return errorReply(e.what());
    } catch (const std::exception& e) {
        logger_->error("Command '" + command + "' failed: " + e.what());
        return errorReply(e.what());
    }
}

std::size_t CommandProcessor::serve(std::istream& in, std::ostream& out, const std::atomic<bool>& stop_requested) {
    std::size_t answered = 0;
    std::string line;
    while (!stop_requested && std::getline(in, line)) {
        const std::string trimmed = Utils::trim(line);
        if (trimmed == "QUIT" || trimmed == "quit") {
            break;
        }
        if (trimmed.empty()) {
            continue;
        }
        out << process(trimmed) << std::endl;
        ++answered;
    }
    return answered;
}

std::string CommandProcessor::handlePut(const std::vector<std::string>& tokens, const std::string& line) {
    if (tokens.size() < 4) {
        return errorReply("usage: PUT <owner> <category> <key> [ttl=<seconds>] <json object>");
    }
    MemoryKey key = keyFrom(tokens);

    // Skip past "PUT owner category key" in the original line
    std::istringstream stream(line);
    std::string skipped;
    for (int i = 0; i < 4; ++i) {
        stream >> skipped;
    }
    std::string rest;
    std::getline(stream, rest);
    rest = Utils::trim(rest);

    std::optional<std::chrono::milliseconds> ttl;
    if (rest.compare(0, TTL_PREFIX.size(), TTL_PREFIX) == 0) {
        const std::size_t end = rest.find_first_of(" \t");
        const std::string ttl_text = rest.substr(TTL_PREFIX.size(), end == std::string::npos ? std::string::npos : end - TTL_PREFIX.size());
        auto seconds = Utils::stringToInt(ttl_text);
        if (!seconds || *seconds <= 0) {
            return errorReply("ttl must be a positive number of seconds, got '" + ttl_text + "'");
        }
        ttl = std::chrono::seconds(*seconds);
        rest = end == std::string::npos ? "" : Utils::trim(rest.substr(end));
    }
    if (rest.empty()) {
        return errorReply("missing JSON record");
    }

    json record = json::parse(rest);
    if (!repository_->save(key, record, ttl)) {
        return errorReply("store write failed");
    }
    return OK_REPLY;
}

std::string CommandProcessor::handleGet(const std::vector<std::string>& tokens) {
    if (tokens.size() != 4) {
        return errorReply("usage: GET <owner> <category> <key>");
    }
    auto record = repository_->load(keyFrom(tokens));
    return record ? record->dump() : NIL_REPLY;
}

std::string CommandProcessor::handleDel(const std::vector<std::string>& tokens) {
    if (tokens.size() != 4) {
        return errorReply("usage: DEL <owner> <category> <key>");
    }
    return repository_->forget(keyFrom(tokens)) ? "1" : "0";
}

std::string CommandProcessor::handleClear(const std::vector<std::string>& tokens) {
    if (tokens.size() != 2) {
        return errorReply("usage: CLEAR <owner>");
    }
    const std::size_t removed = cache_->clearForOwner(tokens[1]);
    logger_->info("Cleared " + std::to_string(removed) + " cached entries for owner " + tokens[1]);
    return std::to_string(removed);
}

std::string CommandProcessor::handleDump(const std::vector<std::string>& tokens) {
    if (tokens.size() > 2) {
        return errorReply("usage: DUMP [owner]");
    }
    std::optional<std::string> owner;
    if (tokens.size() == 2) {
        owner = tokens[1];
    }
    return cache_->exportEntries(owner).dump();
}

std::vector<std::string> CommandProcessor::tokenize(const std::string& line) {
    std::vector<std::string> tokens;
    std::istringstream stream(line);
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

MemoryKey CommandProcessor::keyFrom(const std::vector<std::string>& tokens) {
    return MemoryKey(tokens[1], tokens[2], tokens[3]);
}
