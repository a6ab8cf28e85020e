#pragma once

#include "core/collaborators.hpp"

#include <atomic>
#include <deque>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace privguard::testing {

/**
 * @brief Contextual detector that "finds" a fixed list of (value, kind)
 * pairs at every place they occur in the text.
 */
class MockContextualDetector : public IContextualDetector {
public:
    enum class Mode { OK, UNAVAILABLE, THROWS };

    explicit MockContextualDetector(std::vector<std::pair<std::string, EntityKind>> known = {},
                                    Mode mode = Mode::OK)
        : known_(std::move(known)), mode_(mode) {}

    [[nodiscard]] Result<std::vector<Entity>> detect(const std::string& text) override {
        call_count_.fetch_add(1, std::memory_order_relaxed);
        if (mode_ == Mode::THROWS) {
            throw std::runtime_error("mock contextual detector exploded");
        }
        if (mode_ == Mode::UNAVAILABLE) {
            return Result<std::vector<Entity>>::error(
                ErrorCategory::COLLABORATOR_UNAVAILABLE, "mock detector offline");
        }

        std::vector<Entity> out;
        for (const auto& [value, kind] : known_) {
            for (size_t pos = text.find(value); pos != std::string::npos;
                 pos = text.find(value, pos + value.size())) {
                out.emplace_back(kind, pos, pos + value.size(), value,
                                 DetectionSource::INFERRED, 0.9);
            }
        }
        return Result<std::vector<Entity>>::ok(std::move(out));
    }

    [[nodiscard]] int call_count() const { return call_count_.load(std::memory_order_relaxed); }

private:
    std::vector<std::pair<std::string, EntityKind>> known_;
    Mode mode_;
    std::atomic<int> call_count_{0};
};

/// Returns a caller-supplied entity list untouched
class RawContextualDetector : public IContextualDetector {
public:
    explicit RawContextualDetector(std::vector<Entity> entities)
        : entities_(std::move(entities)) {}

    [[nodiscard]] Result<std::vector<Entity>> detect(const std::string& /*text*/) override {
        return Result<std::vector<Entity>>::ok(entities_);
    }

private:
    std::vector<Entity> entities_;
};

class MockKindClassifier : public IKindClassifier {
public:
    explicit MockKindClassifier(bool available = true) : available_(available) {}

    void set(const EntityKind& kind, Sensitivity s, RegulationSet regs) {
        table_[kind] = KindClassification{s, std::move(regs)};
    }

    [[nodiscard]] Result<KindClassification> classify(const EntityKind& kind) override {
        ++call_count_;
        if (!available_) {
            return Result<KindClassification>::error(
                ErrorCategory::COLLABORATOR_UNAVAILABLE, "mock classifier offline");
        }
        const auto it = table_.find(kind);
        if (it == table_.end()) {
            return Result<KindClassification>::error(
                ErrorCategory::COLLABORATOR_UNAVAILABLE, "unknown kind");
        }
        return Result<KindClassification>::ok(it->second);
    }

    [[nodiscard]] int call_count() const { return call_count_; }

private:
    bool available_;
    std::unordered_map<EntityKind, KindClassification> table_;
    int call_count_ = 0;
};

class MockCitationSource : public ICitationSource {
public:
    explicit MockCitationSource(bool available = true) : available_(available) {}

    [[nodiscard]] Result<std::vector<Citation>> fetch(
        Regulation regulation, const std::vector<EntityKind>& /*kinds*/) override {
        ++call_count_;
        if (!available_) {
            return Result<std::vector<Citation>>::error(
                ErrorCategory::COLLABORATOR_UNAVAILABLE, "mock citations offline");
        }
        return Result<std::vector<Citation>>::ok(citations_for(regulation));
    }

    void add(Citation citation) { citations_.push_back(std::move(citation)); }

    [[nodiscard]] int call_count() const { return call_count_; }

private:
    std::vector<Citation> citations_for(Regulation regulation) const {
        std::vector<Citation> out;
        for (const auto& c : citations_) {
            if (c.regulation == regulation) out.push_back(c);
        }
        return out;
    }

    bool available_;
    std::vector<Citation> citations_;
    int call_count_ = 0;
};

/**
 * @brief Residual checker replaying scripted replies.
 *
 * Each call pops the next reply; once the script is exhausted the last
 * reply repeats. An empty script means "clean".
 */
class ScriptedResidualChecker : public IResidualPiiChecker {
public:
    using Reply = Result<std::vector<std::string>>;

    ScriptedResidualChecker() = default;
    explicit ScriptedResidualChecker(std::deque<Reply> script) : script_(std::move(script)) {}

    static Reply clean() { return Reply::ok({}); }
    static Reply flagged(std::vector<std::string> categories) {
        return Reply::ok(std::move(categories));
    }
    static Reply unavailable() {
        return Reply::error(ErrorCategory::COLLABORATOR_UNAVAILABLE, "mock checker offline");
    }

    [[nodiscard]] Reply check(const std::string& text) override {
        ++call_count_;
        last_text_ = text;
        if (script_.empty()) return clean();
        Reply reply = script_.front();
        if (script_.size() > 1) script_.pop_front();
        return reply;
    }

    [[nodiscard]] int call_count() const { return call_count_; }
    [[nodiscard]] const std::string& last_text() const { return last_text_; }

private:
    std::deque<Reply> script_;
    int call_count_ = 0;
    std::string last_text_;
};

/// Pattern detector returning a fixed list, regardless of input
class FixedPatternDetector : public IPatternDetector {
public:
    explicit FixedPatternDetector(std::vector<Entity> entities = {})
        : entities_(std::move(entities)) {}

    [[nodiscard]] std::vector<Entity> detect(const std::string& /*text*/) const override {
        return entities_;
    }

private:
    std::vector<Entity> entities_;
};

} // namespace privguard::testing
