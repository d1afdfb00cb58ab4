#include "nfcollect/template_store.hpp"
#include "nfcollect/logging.hpp"
#include <iterator>
#include <tuple>

namespace nfcollect {

bool operator==(const FieldSpec& lhs, const FieldSpec& rhs) {
    return lhs.type == rhs.type && lhs.length == rhs.length &&
           lhs.enterprise_number == rhs.enterprise_number;
}

bool operator!=(const FieldSpec& lhs, const FieldSpec& rhs) {
    return !(lhs == rhs);
}

size_t Template::min_record_length() const {
    size_t length = 0;
    for (const auto& field : fields) {
        length += field.is_variable_length() ? 1 : field.length;
    }
    return length;
}

bool Template::has_variable_length_fields() const {
    for (const auto& field : fields) {
        if (field.is_variable_length()) {
            return true;
        }
    }
    return false;
}

bool operator==(const Template& lhs, const Template& rhs) {
    return lhs.template_id == rhs.template_id && lhs.kind == rhs.kind &&
           lhs.version == rhs.version && lhs.scope_field_count == rhs.scope_field_count &&
           lhs.fields == rhs.fields;
}

std::string Exporter::to_string() const {
    return address + "/" + std::to_string(domain_id);
}

bool operator<(const Exporter& lhs, const Exporter& rhs) {
    return std::tie(lhs.address, lhs.domain_id) < std::tie(rhs.address, rhs.domain_id);
}

bool operator==(const Exporter& lhs, const Exporter& rhs) {
    return lhs.address == rhs.address && lhs.domain_id == rhs.domain_id;
}

TemplateStore::TemplateStore(TemplateStoreOptions options)
    : options_(options) {
}

bool TemplateStore::put(const Exporter& exporter, uint16_t template_id, Template tmpl,
                        Clock::time_point now) {
    ExporterTemplates& templates = exporters_[exporter];
    tmpl.template_id = template_id;

    auto it = templates.entries.find(template_id);
    if (it != templates.entries.end()) {
        if (!(it->second.tmpl == tmpl)) {
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Template {} of {} redefined ({} fields)",
                                template_id, exporter.to_string(), tmpl.fields.size());
        }
        it->second.tmpl = std::move(tmpl);
        it->second.refreshed = now;
        templates.lru.splice(templates.lru.begin(), templates.lru, it->second.lru_position);
        stats_.replaced++;
        return true;
    }

    templates.lru.push_front(template_id);
    Entry entry;
    entry.tmpl = std::move(tmpl);
    entry.refreshed = now;
    entry.lru_position = templates.lru.begin();
    templates.entries.emplace(template_id, std::move(entry));
    stats_.stored++;

    if (options_.max_templates_per_exporter > 0) {
        while (templates.entries.size() > options_.max_templates_per_exporter) {
            uint16_t victim = templates.lru.back();
            SPDLOG_LOGGER_DEBUG(Logger::instance(), "Evicting template {} of {} (LRU)",
                                victim, exporter.to_string());
            erase(templates, templates.entries.find(victim));
            stats_.evicted++;
        }
    }

    return false;
}

const Template* TemplateStore::get(const Exporter& exporter, uint16_t template_id,
                                   Clock::time_point now) {
    auto exporter_it = exporters_.find(exporter);
    if (exporter_it == exporters_.end()) {
        return nullptr;
    }

    ExporterTemplates& templates = exporter_it->second;
    auto it = templates.entries.find(template_id);
    if (it == templates.entries.end()) {
        return nullptr;
    }

    if (is_expired(it->second, now)) {
        SPDLOG_LOGGER_DEBUG(Logger::instance(), "Template {} of {} expired",
                            template_id, exporter.to_string());
        erase(templates, it);
        if (templates.entries.empty()) {
            exporters_.erase(exporter_it);
        }
        stats_.expired++;
        return nullptr;
    }

    templates.lru.splice(templates.lru.begin(), templates.lru, it->second.lru_position);
    return &it->second.tmpl;
}

bool TemplateStore::remove(const Exporter& exporter, uint16_t template_id) {
    auto exporter_it = exporters_.find(exporter);
    if (exporter_it == exporters_.end()) {
        return false;
    }

    auto it = exporter_it->second.entries.find(template_id);
    if (it == exporter_it->second.entries.end()) {
        return false;
    }

    erase(exporter_it->second, it);
    if (exporter_it->second.entries.empty()) {
        exporters_.erase(exporter_it);
    }
    stats_.withdrawn++;
    return true;
}

size_t TemplateStore::remove(const Exporter& exporter) {
    auto exporter_it = exporters_.find(exporter);
    if (exporter_it == exporters_.end()) {
        return 0;
    }

    size_t removed = exporter_it->second.entries.size();
    exporters_.erase(exporter_it);
    stats_.withdrawn += removed;
    return removed;
}

size_t TemplateStore::expire(Clock::time_point now) {
    size_t expired = 0;

    for (auto exporter_it = exporters_.begin(); exporter_it != exporters_.end();) {
        ExporterTemplates& templates = exporter_it->second;
        for (auto it = templates.entries.begin(); it != templates.entries.end();) {
            if (is_expired(it->second, now)) {
                auto next = std::next(it);
                erase(templates, it);
                it = next;
                expired++;
            } else {
                ++it;
            }
        }

        // Exporters that went silent are forgotten with their last template
        if (templates.entries.empty()) {
            exporter_it = exporters_.erase(exporter_it);
        } else {
            ++exporter_it;
        }
    }

    stats_.expired += expired;
    return expired;
}

size_t TemplateStore::size() const {
    size_t count = 0;
    for (const auto& [exporter, templates] : exporters_) {
        count += templates.entries.size();
    }
    return count;
}

size_t TemplateStore::size(const Exporter& exporter) const {
    auto it = exporters_.find(exporter);
    return it == exporters_.end() ? 0 : it->second.entries.size();
}

bool TemplateStore::is_expired(const Entry& entry, Clock::time_point now) const {
    if (options_.template_timeout.count() <= 0) {
        return false;
    }
    return now - entry.refreshed > options_.template_timeout;
}

void TemplateStore::erase(ExporterTemplates& templates,
                          std::unordered_map<uint16_t, Entry>::iterator it) {
    templates.lru.erase(it->second.lru_position);
    templates.entries.erase(it);
}

} // namespace nfcollect
