#ifndef NFCOLLECT_TEMPLATE_STORE_HPP
#define NFCOLLECT_TEMPLATE_STORE_HPP

#include "field_types.hpp"
#include <chrono>
#include <cstdint>
#include <list>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace nfcollect {

/**
 * Field specifier of a template record
 */
struct FieldSpec {
    uint16_t type = 0;
    uint16_t length = 0;
    uint32_t enterprise_number = 0;  // IPFIX only, 0 when the enterprise bit is clear

    FieldSpec() = default;
    FieldSpec(uint16_t field_type, uint16_t field_length, uint32_t enterprise = 0)
        : type(field_type), length(field_length), enterprise_number(enterprise) {}

    bool is_variable_length() const { return length == VARIABLE_LENGTH; }
};

bool operator==(const FieldSpec& lhs, const FieldSpec& rhs);
bool operator!=(const FieldSpec& lhs, const FieldSpec& rhs);

enum class TemplateKind {
    DATA,
    OPTIONS
};

/**
 * Data or options template announced by an exporter
 */
struct Template {
    uint16_t template_id = 0;
    TemplateKind kind = TemplateKind::DATA;
    ProtocolVersion version = ProtocolVersion::NETFLOW_V9;

    // Leading scope fields of an options template
    uint16_t scope_field_count = 0;
    std::vector<FieldSpec> fields;

    /**
     * Smallest possible encoded record: fixed lengths plus one length
     * octet per variable-length field
     */
    size_t min_record_length() const;

    bool has_variable_length_fields() const;
};

bool operator==(const Template& lhs, const Template& rhs);

/**
 * Exporting process: source address plus the header's source ID
 * (NetFlow v9) or observation domain ID (IPFIX)
 */
struct Exporter {
    std::string address;
    uint32_t domain_id = 0;

    std::string to_string() const;
};

bool operator<(const Exporter& lhs, const Exporter& rhs);
bool operator==(const Exporter& lhs, const Exporter& rhs);

struct TemplateStoreOptions {
    // Least-recently-used templates beyond this count are evicted, 0 = unbounded
    size_t max_templates_per_exporter = 1024;

    // Templates not refreshed within this period are forgotten, 0 = never
    std::chrono::seconds template_timeout{1800};
};

/**
 * Per-exporter cache of templates
 *
 * A template ID is only meaningful together with its exporter; two
 * exporters may use the same ID for unrelated layouts. Redefining an ID
 * replaces the previous layout.
 *
 * Two eviction rules bound memory for long-running collectors:
 *   - LRU: each exporter keeps at most max_templates_per_exporter entries,
 *     the one least recently stored or looked up is evicted first.
 *   - Expiry: a template whose last put() is older than template_timeout
 *     is dropped on access or by expire().
 *
 * The store is not synchronized; the collector confines each store to the
 * worker that owns the exporter.
 */
class TemplateStore {
public:
    using Clock = std::chrono::steady_clock;

    struct Stats {
        uint64_t stored = 0;
        uint64_t replaced = 0;
        uint64_t evicted = 0;
        uint64_t expired = 0;
        uint64_t withdrawn = 0;
    };

    explicit TemplateStore(TemplateStoreOptions options = TemplateStoreOptions());

    /**
     * Store or replace a template
     *
     * @return true if an existing template with the same ID was replaced
     */
    bool put(const Exporter& exporter, uint16_t template_id, Template tmpl,
             Clock::time_point now = Clock::now());

    /**
     * Current layout of a template
     *
     * @return nullptr when the template is unknown or expired. The pointer
     *         stays valid until the next modification of the store.
     */
    const Template* get(const Exporter& exporter, uint16_t template_id,
                        Clock::time_point now = Clock::now());

    /**
     * Withdraw a single template
     */
    bool remove(const Exporter& exporter, uint16_t template_id);

    /**
     * Forget every template of an exporter
     *
     * @return number of templates removed
     */
    size_t remove(const Exporter& exporter);

    /**
     * Drop every template older than the timeout
     *
     * @return number of templates expired
     */
    size_t expire(Clock::time_point now = Clock::now());

    size_t size() const;
    size_t size(const Exporter& exporter) const;

    // Exporters with at least one template
    size_t exporter_count() const { return exporters_.size(); }

    const Stats& stats() const { return stats_; }
    const TemplateStoreOptions& options() const { return options_; }

private:
    struct Entry {
        Template tmpl;
        Clock::time_point refreshed;
        std::list<uint16_t>::iterator lru_position;
    };

    struct ExporterTemplates {
        std::unordered_map<uint16_t, Entry> entries;
        std::list<uint16_t> lru;  // front = most recently used
    };

    bool is_expired(const Entry& entry, Clock::time_point now) const;
    void erase(ExporterTemplates& templates,
               std::unordered_map<uint16_t, Entry>::iterator it);

    TemplateStoreOptions options_;
    std::map<Exporter, ExporterTemplates> exporters_;
    Stats stats_;
};

} // namespace nfcollect

#endif // NFCOLLECT_TEMPLATE_STORE_HPP
