#pragma once
#include <stdexcept>
#include <string>

namespace tokbench {

/**
 * @brief Root of the tokbench error taxonomy.
 *
 * Per-sentence errors (LoadError, CleaningError, TokenizerRuntimeError) are
 * recoverable and end up as skipped records. TokenizerInitError removes one
 * tokenizer from a run. StoreError and ConfigError abort the run.
 */
class TokbenchError : public std::runtime_error {
public:
    explicit TokbenchError(const std::string& message) : std::runtime_error(message) {}
};

// Malformed input line.
class LoadError : public TokbenchError {
public:
    explicit LoadError(const std::string& message) : TokbenchError(message) {}
};

// Encoding or rule failure while cleaning a sentence.
class CleaningError : public TokbenchError {
public:
    explicit CleaningError(const std::string& message) : TokbenchError(message) {}
};

class TokenizerInitError : public TokbenchError {
public:
    explicit TokenizerInitError(const std::string& message) : TokbenchError(message) {}
};

class TokenizerRuntimeError : public TokbenchError {
public:
    explicit TokenizerRuntimeError(const std::string& message) : TokbenchError(message) {}
};

class StoreError : public TokbenchError {
public:
    explicit StoreError(const std::string& message) : TokbenchError(message) {}
};

class ConfigError : public TokbenchError {
public:
    explicit ConfigError(const std::string& message) : TokbenchError(message) {}
};

} // namespace tokbench
