#ifndef COMMANDPROCESSOR_HPP
#define COMMANDPROCESSOR_HPP

#include <atomic>
#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "MemoryRepository.hpp"
#include "../cache/MemoryCache.hpp"
#include "../interfaces/ILogger.hpp"

// Line protocol for operating a cache process from a console:
//
//   PUT <owner> <category> <key> [ttl=<seconds>] <json object>
//   GET <owner> <category> <key>
//   DEL <owner> <category> <key>
//   CLEAR <owner>
//   FLUSH
//   SWEEP
//   STATS
//   DUMP [owner]
//   HELP
//
// Every line gets exactly one reply. Failures reply "ERR <reason>".
class CommandProcessor {
public:
    CommandProcessor(std::shared_ptr<MemoryRepository> repository,
                     std::shared_ptr<MemoryCache> cache,
                     std::shared_ptr<ILogger> logger);

    std::string process(const std::string& line);

    // Replies to each line of `in` on `out` until EOF, QUIT, or until
    // stop_requested is set. Blank lines are skipped. Returns the number of
    // commands answered.
    std::size_t serve(std::istream& in, std::ostream& out, const std::atomic<bool>& stop_requested);

    static std::string usage();

private:
    std::string handlePut(const std::vector<std::string>& tokens, const std::string& line);
    std::string handleGet(const std::vector<std::string>& tokens);
    std::string handleDel(const std::vector<std::string>& tokens);
    std::string handleClear(const std::vector<std::string>& tokens);
    std::string handleDump(const std::vector<std::string>& tokens);

    static std::vector<std::string> tokenize(const std::string& line);
    static MemoryKey keyFrom(const std::vector<std::string>& tokens);

    std::shared_ptr<MemoryRepository> repository_;
    std::shared_ptr<MemoryCache> cache_;
    std::shared_ptr<ILogger> logger_;
};

#endif // COMMANDPROCESSOR_HPP
