// EN: Unit tests for the field mapping builder and the FieldResolver
// FR: Tests unitaires du builder de mapping de champs et du FieldResolver

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "csv/field_resolver.hpp"
#include "infrastructure/logging/logger.hpp"

using namespace CSVS::CSV;
using ::testing::ElementsAre;

namespace {

struct Location {
    double lat{0};
    double lon{0};
};

struct Shipment {
    int id{0};
    std::string carrier;
    double weight{0};
    bool fragile{false};
    std::string notes;
    Location origin;
};

FieldInfo makeInfo(const std::string& name, FieldKind kind = FieldKind::TEXT) {
    FieldInfo info;
    info.name = name;
    info.kind = kind;
    return info;
}

} // namespace

class FieldResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        CSVS::Logger::getInstance().setLogLevel(CSVS::LogLevel::ERROR);
    }

    RecordSchema<Shipment> plainSchema() {
        RecordSchema<Shipment> schema;
        schema.name("Shipment");
        schema.field("weight", &Shipment::weight);
        schema.field("Carrier", &Shipment::carrier);
        schema.field("id", &Shipment::id);
        schema.field("fragile", &Shipment::fragile);
        schema.field("notes", &Shipment::notes).ignore();
        schema.field<Location>("origin", &Shipment::origin,
                               [](const Location& l) { return std::to_string(l.lat) + ";" + std::to_string(l.lon); },
                               [](const std::string&) { return Location{}; });
        return schema;
    }
};

TEST_F(FieldResolverTest, SchemaRecordsKindsAndMarkers) {
    RecordSchema<Shipment> schema = plainSchema();
    ASSERT_EQ(schema.fields().size(), 6u);
    EXPECT_EQ(schema.typeName(), "Shipment");

    std::vector<FieldInfo> infos = schema.infos();
    EXPECT_EQ(infos[0].kind, FieldKind::REAL);
    EXPECT_EQ(infos[2].kind, FieldKind::INTEGER);
    EXPECT_EQ(infos[3].kind, FieldKind::BOOLEAN);
    EXPECT_TRUE(infos[4].ignored);
    EXPECT_EQ(infos[5].kind, FieldKind::OBJECT);
}

TEST_F(FieldResolverTest, FieldsSortedByNameWithoutMarkers) {
    RecordSchema<Shipment> schema = plainSchema();
    ActiveFieldSet active = FieldResolver::resolve(schema.typeName(), schema.infos(), true);

    EXPECT_FALSE(active.explicit_ordering);
    EXPECT_THAT(active.names(), ElementsAre("Carrier", "fragile", "id", "weight"));
    for (const auto& field : active.fields) {
        EXPECT_EQ(field.order, 0);
    }
}

TEST_F(FieldResolverTest, ReferenceFieldsKeptWhenRequested) {
    RecordSchema<Shipment> schema = plainSchema();
    ActiveFieldSet active = FieldResolver::resolve(schema.typeName(), schema.infos(), false);

    EXPECT_THAT(active.names(), ElementsAre("Carrier", "fragile", "id", "origin", "weight"));
}

TEST_F(FieldResolverTest, MarkedFieldsOnlyAndSortedByOrder) {
    RecordSchema<Shipment> schema;
    schema.field("id", &Shipment::id).column("Shipment #", 1);
    schema.field("carrier", &Shipment::carrier).column("Carrier Name", 3);
    schema.field("weight", &Shipment::weight).column("", 2);
    schema.field("fragile", &Shipment::fragile);

    ActiveFieldSet active = FieldResolver::resolve("Shipment", schema.infos(), true);

    EXPECT_TRUE(active.explicit_ordering);
    EXPECT_THAT(active.names(), ElementsAre("id", "weight", "carrier"));
    EXPECT_THAT(active.titles(), ElementsAre("Shipment #", "weight", "Carrier Name"));
    EXPECT_EQ(active.fields[1].order, 2);
}

TEST_F(FieldResolverTest, EqualOrdersKeepNameOrder) {
    std::vector<FieldInfo> infos = {makeInfo("zeta"), makeInfo("Alpha"), makeInfo("beta")};
    for (auto& info : infos) {
        info.has_column = true;
        info.order = 5;
    }
    infos[0].order = 1;

    ActiveFieldSet active = FieldResolver::resolve("Sample", infos, true);
    EXPECT_THAT(active.names(), ElementsAre("zeta", "Alpha", "beta"));
}

TEST_F(FieldResolverTest, NoDeclaredFieldsIsFormatError) {
    EXPECT_THROW(FieldResolver::resolve("Empty", {}, true), FormatError);
}

TEST_F(FieldResolverTest, EverythingFilteredIsFormatError) {
    std::vector<FieldInfo> infos = {makeInfo("payload", FieldKind::OBJECT), makeInfo("skip")};
    infos[1].ignored = true;

    EXPECT_THROW(FieldResolver::resolve("Filtered", infos, true), FormatError);
}

TEST_F(FieldResolverTest, DuplicateTitlesAreFormatError) {
    std::vector<FieldInfo> infos = {makeInfo("first"), makeInfo("second")};
    infos[0].has_column = true;
    infos[0].column_title = "Name";
    infos[1].has_column = true;
    infos[1].column_title = "NAME";

    try {
        FieldResolver::resolve("Clash", infos, true);
        FAIL() << "expected FormatError";
    } catch (const FormatError& e) {
        EXPECT_NE(std::string(e.what()).find("Duplicate"), std::string::npos);
    }
}

TEST_F(FieldResolverTest, NameOrderingIsCaseInsensitiveWithOrdinalTiebreak) {
    EXPECT_TRUE(FieldResolver::nameLess("apple", "Banana"));
    EXPECT_TRUE(FieldResolver::nameLess("Name", "name"));
    EXPECT_FALSE(FieldResolver::nameLess("name", "Name"));
}
