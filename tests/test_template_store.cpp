#include <gtest/gtest.h>
#include <nfcollect/template_store.hpp>

using namespace nfcollect;
using namespace std::chrono_literals;

class TemplateStoreTest : public ::testing::Test {
protected:
    static Template make_template(std::vector<FieldSpec> fields) {
        Template tmpl;
        tmpl.fields = std::move(fields);
        return tmpl;
    }

    Exporter router_a{"192.0.2.1", 0};
    Exporter router_b{"192.0.2.2", 0};
    TemplateStore::Clock::time_point t0 = TemplateStore::Clock::now();
};

TEST_F(TemplateStoreTest, PutAndGet) {
    TemplateStore store;

    EXPECT_FALSE(store.put(router_a, 256, make_template({{1, 4}, {2, 4}}), t0));

    const Template* tmpl = store.get(router_a, 256, t0);
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->template_id, 256);
    ASSERT_EQ(tmpl->fields.size(), 2u);
    EXPECT_EQ(tmpl->fields[0], FieldSpec(1, 4));
    EXPECT_EQ(tmpl->min_record_length(), 8u);
    EXPECT_EQ(store.size(), 1u);
}

TEST_F(TemplateStoreTest, MissingTemplate) {
    TemplateStore store;
    EXPECT_EQ(store.get(router_a, 256, t0), nullptr);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    EXPECT_EQ(store.get(router_a, 257, t0), nullptr);
}

TEST_F(TemplateStoreTest, TemplatesAreScopedByExporter) {
    TemplateStore store;
    store.put(router_a, 256, make_template({{1, 4}}), t0);
    store.put(router_b, 256, make_template({{1, 8}, {2, 8}}), t0);

    EXPECT_EQ(store.get(router_a, 256, t0)->fields.size(), 1u);
    EXPECT_EQ(store.get(router_b, 256, t0)->fields.size(), 2u);
    EXPECT_EQ(store.size(router_a), 1u);
    EXPECT_EQ(store.size(router_b), 1u);

    Exporter other_domain{"192.0.2.1", 7};
    EXPECT_EQ(store.get(other_domain, 256, t0), nullptr);
}

TEST_F(TemplateStoreTest, RedefinitionReplaces) {
    TemplateStore store;
    store.put(router_a, 256, make_template({{1, 4}}), t0);
    EXPECT_TRUE(store.put(router_a, 256, make_template({{1, 8}, {8, 4}}), t0));

    const Template* tmpl = store.get(router_a, 256, t0);
    ASSERT_NE(tmpl, nullptr);
    EXPECT_EQ(tmpl->fields.size(), 2u);
    EXPECT_EQ(tmpl->fields[0].length, 8);
    EXPECT_EQ(store.size(), 1u);
    EXPECT_EQ(store.stats().stored, 1u);
    EXPECT_EQ(store.stats().replaced, 1u);
}

TEST_F(TemplateStoreTest, LeastRecentlyUsedIsEvicted) {
    TemplateStoreOptions options;
    options.max_templates_per_exporter = 2;
    TemplateStore store(options);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    store.put(router_a, 257, make_template({{1, 4}}), t0);
    ASSERT_NE(store.get(router_a, 256, t0), nullptr);  // 257 is now the oldest
    store.put(router_a, 258, make_template({{1, 4}}), t0);

    EXPECT_EQ(store.size(router_a), 2u);
    EXPECT_NE(store.get(router_a, 256, t0), nullptr);
    EXPECT_EQ(store.get(router_a, 257, t0), nullptr);
    EXPECT_NE(store.get(router_a, 258, t0), nullptr);
    EXPECT_EQ(store.stats().evicted, 1u);
}

TEST_F(TemplateStoreTest, CapacityIsPerExporter) {
    TemplateStoreOptions options;
    options.max_templates_per_exporter = 1;
    TemplateStore store(options);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    store.put(router_b, 256, make_template({{1, 4}}), t0);

    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.stats().evicted, 0u);
}

TEST_F(TemplateStoreTest, StaleTemplatesExpireOnLookup) {
    TemplateStoreOptions options;
    options.template_timeout = 10s;
    TemplateStore store(options);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    EXPECT_NE(store.get(router_a, 256, t0 + 5s), nullptr);
    EXPECT_EQ(store.get(router_a, 256, t0 + 11s), nullptr);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.stats().expired, 1u);
}

TEST_F(TemplateStoreTest, SilentExportersAreForgotten) {
    TemplateStoreOptions options;
    options.template_timeout = 10s;
    TemplateStore store(options);

    for (uint32_t i = 0; i < 100; i++) {
        Exporter exporter{"198.51.100." + std::to_string(i), i};
        store.put(exporter, 256, make_template({{1, 4}}), t0);
    }
    store.put(router_a, 256, make_template({{1, 4}}), t0 + 8s);
    EXPECT_EQ(store.exporter_count(), 101u);

    EXPECT_EQ(store.expire(t0 + 12s), 100u);
    EXPECT_EQ(store.exporter_count(), 1u);
    EXPECT_EQ(store.size(router_a), 1u);

    EXPECT_EQ(store.expire(t0 + 30s), 1u);
    EXPECT_EQ(store.exporter_count(), 0u);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(TemplateStoreTest, LastTemplateGoneDropsExporter) {
    TemplateStoreOptions options;
    options.template_timeout = 10s;
    TemplateStore store(options);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    store.put(router_b, 256, make_template({{1, 4}}), t0);
    EXPECT_EQ(store.get(router_a, 256, t0 + 11s), nullptr);
    EXPECT_TRUE(store.remove(router_b, 256));
    EXPECT_EQ(store.exporter_count(), 0u);

    // Stored again after being dropped
    store.put(router_a, 300, make_template({{1, 4}}), t0 + 20s);
    EXPECT_EQ(store.exporter_count(), 1u);
    EXPECT_NE(store.get(router_a, 300, t0 + 21s), nullptr);
}

TEST_F(TemplateStoreTest, RefreshExtendsLifetime) {
    TemplateStoreOptions options;
    options.template_timeout = 10s;
    TemplateStore store(options);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    store.put(router_a, 257, make_template({{1, 4}}), t0);
    store.put(router_a, 256, make_template({{1, 4}}), t0 + 8s);

    EXPECT_EQ(store.expire(t0 + 12s), 1u);
    EXPECT_NE(store.get(router_a, 256, t0 + 12s), nullptr);
    EXPECT_EQ(store.get(router_a, 257, t0 + 12s), nullptr);
}

TEST_F(TemplateStoreTest, ZeroTimeoutNeverExpires) {
    TemplateStoreOptions options;
    options.template_timeout = 0s;
    TemplateStore store(options);

    store.put(router_a, 256, make_template({{1, 4}}), t0);
    EXPECT_EQ(store.expire(t0 + 24h), 0u);
    EXPECT_NE(store.get(router_a, 256, t0 + 24h), nullptr);
}

TEST_F(TemplateStoreTest, Remove) {
    TemplateStore store;
    store.put(router_a, 256, make_template({{1, 4}}), t0);
    store.put(router_a, 257, make_template({{1, 4}}), t0);
    store.put(router_a, 258, make_template({{1, 4}}), t0);

    EXPECT_TRUE(store.remove(router_a, 256));
    EXPECT_FALSE(store.remove(router_a, 256));
    EXPECT_EQ(store.remove(router_a), 2u);
    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(store.stats().withdrawn, 3u);
}
