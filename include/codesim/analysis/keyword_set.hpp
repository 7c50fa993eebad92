#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>

namespace codesim::analysis {

/**
 * Immutable set of reserved words shared by the tokenizer and normalizer.
 *
 * Copies share the underlying storage, so one set can be handed to every
 * worker without synchronization.
 */
class KeywordSet {
public:
    KeywordSet();
    explicit KeywordSet(std::set<std::string> words);

    bool contains(const std::string& word) const {
        return words_->count(word) > 0;
    }

    size_t size() const { return words_->size(); }
    bool empty() const { return words_->empty(); }

    const std::set<std::string>& words() const { return *words_; }

    // Returns a new set with extra words added
    KeywordSet with(const std::vector<std::string>& extra) const;

    static KeywordSet java();
    static KeywordSet javascript();

    // Java plus JavaScript/TypeScript, the default grammar
    static KeywordSet java_and_javascript();

private:
    std::shared_ptr<const std::set<std::string>> words_;
};

}  // namespace codesim::analysis
