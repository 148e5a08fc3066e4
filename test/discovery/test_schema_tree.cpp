#include <catch2/catch_test_macros.hpp>

#include <azlist/discovery/schema_tree.hpp>

#include <string>
#include <utility>
#include <vector>

using namespace azlist;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/discovery
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
}

SchemaTree MustBuild(SchemaTree::Snapshot snapshot) {
    auto tree = SchemaTree::Build(std::move(snapshot));
    REQUIRE(tree.IsOk());
    return std::move(tree).Value();
}

} // anonymous namespace

// ===========================================================================
// Build
// ===========================================================================

TEST_CASE("SchemaTree: links children to parents", "[discovery][schema]") {
    auto tree = MustBuild({
        {"Microsoft.Network/virtualNetworks", {"2023-05-01"}},
        {"Microsoft.Network/virtualNetworks/subnets", {"2022-07-01", "2023-05-01"}},
    });

    const auto* vnet = tree.Find("/Microsoft.Network/virtualNetworks");
    REQUIRE(vnet != nullptr);
    REQUIRE(vnet->children.size() == 1);
    const auto& subnets = vnet->children.at("SUBNETS");
    CHECK(subnets->type_name == "subnets");
    CHECK(subnets->LatestVersion() == "2023-05-01");
    CHECK(tree.Find("Microsoft.Network/virtualNetworks/subnets") == subnets.get());
}

TEST_CASE("SchemaTree: parent and child differ in case", "[discovery][schema]") {
    auto tree = MustBuild({
        {"MICROSOFT.NETWORK/virtualnetworks", {"v1"}},
        {"Microsoft.Network/virtualNetworks/subnets", {"v1"}},
    });

    const auto* vnet = tree.Find("microsoft.network/VIRTUALNETWORKS");
    REQUIRE(vnet != nullptr);
    CHECK(vnet->children.count("SUBNETS") == 1);
}

TEST_CASE("SchemaTree: child without parent is still indexed", "[discovery][schema]") {
    auto tree = MustBuild({
        {"Microsoft.Web/sites/slots", {"v1"}},
    });
    CHECK(tree.Size() == 1);
    CHECK(tree.Find("Microsoft.Web/sites") == nullptr);
    CHECK(tree.Find("Microsoft.Web/sites/slots") != nullptr);
}

TEST_CASE("SchemaTree: trailing slash keys merge into the canonical key", "[discovery][schema]") {
    auto tree = MustBuild({
        {"Microsoft.Storage/storageAccounts/", {"2022-09-01"}},
        {"Microsoft.Storage/storageAccounts", {"2023-01-01"}},
    });
    CHECK(tree.Size() == 1);
    const auto* entry = tree.Find("Microsoft.Storage/storageAccounts");
    REQUIRE(entry != nullptr);
    CHECK(entry->versions == std::vector<std::string>{"2022-09-01", "2023-01-01"});
    CHECK(entry->LatestVersion() == "2023-01-01");
}

TEST_CASE("SchemaTree: trailing slash key alone is kept", "[discovery][schema]") {
    auto tree = MustBuild({{"Microsoft.Sql/servers/", {"v1"}}});
    CHECK(tree.Find("Microsoft.Sql/servers") != nullptr);
}

TEST_CASE("SchemaTree: keys differing only in case merge versions", "[discovery][schema]") {
    auto tree = MustBuild({
        {"Microsoft.Web/sites", {"v2"}},
        {"microsoft.web/sites", {"v1"}},
    });
    CHECK(tree.Size() == 1);
    const auto* entry = tree.Find("Microsoft.Web/sites");
    REQUIRE(entry != nullptr);
    CHECK(entry->versions == std::vector<std::string>{"v1", "v2"});
}

TEST_CASE("SchemaTree: child links point at the same entry as Find", "[discovery][schema]") {
    auto tree = MustBuild({
        {"Microsoft.Network/virtualNetworks", {"2023-05-01"}},
        {"Microsoft.Network/virtualNetworks/subnets", {"2022-07-01", "2023-05-01"}},
    });

    const auto* vnet = tree.Find("MICROSOFT.NETWORK/VIRTUALNETWORKS");
    REQUIRE(vnet != nullptr);
    auto it = vnet->children.find("SUBNETS");
    REQUIRE(it != vnet->children.end());

    const auto* subnets = tree.Find("MICROSOFT.NETWORK/VIRTUALNETWORKS/SUBNETS");
    REQUIRE(subnets != nullptr);
    CHECK(it->second.get() == subnets);
    CHECK(subnets->type_name == "subnets");
    CHECK(subnets->versions == std::vector<std::string>{"2022-07-01", "2023-05-01"});
}

// ===========================================================================
// Malformed snapshots
// ===========================================================================

TEST_CASE("SchemaTree: single-segment type is a schema error", "[discovery][schema]") {
    auto tree = SchemaTree::Build({{"Foo", {"v1"}}});
    REQUIRE(tree.IsErr());
    CHECK(tree.Error().category == ErrorCategory::Schema);
    CHECK(tree.Error().message == "malformed resource type: Foo");
}

TEST_CASE("SchemaTree: empty segment is a schema error", "[discovery][schema]") {
    CHECK(SchemaTree::Build({{"A.B//c", {"v1"}}}).IsErr());
    CHECK(SchemaTree::Build({{"/A.B/c", {"v1"}}}).IsErr());
}

TEST_CASE("SchemaTree: type without versions is a schema error", "[discovery][schema]") {
    auto tree = SchemaTree::Build({{"A.B/c", {}}});
    REQUIRE(tree.IsErr());
    CHECK(tree.Error().category == ErrorCategory::Schema);
}

// ===========================================================================
// Snapshot parsing and loading
// ===========================================================================

TEST_CASE("ParseSchemaSnapshot: rejects non-object documents", "[discovery][schema]") {
    CHECK(ParseSchemaSnapshot("[]").IsErr());
    CHECK(ParseSchemaSnapshot("{").IsErr());
    CHECK(ParseSchemaSnapshot(R"({"A.B/c": "v1"})").IsErr());
    CHECK(ParseSchemaSnapshot(R"({"A.B/c": [1]})").IsErr());
}

TEST_CASE("LoadSchemaTree: loads the fixture snapshot", "[discovery][schema]") {
    auto tree = LoadSchemaTree(TestDataPath("schema_snapshot.json"));
    REQUIRE(tree.IsOk());

    const auto* vm = tree.Value().Find("/Microsoft.Compute/virtualMachines");
    REQUIRE(vm != nullptr);
    CHECK(vm->children.count("EXTENSIONS") == 1);

    const auto* vnet = tree.Value().Find("Microsoft.Network/virtualNetworks");
    REQUIRE(vnet != nullptr);
    CHECK(vnet->children.size() == 2);

    const auto* storage = tree.Value().Find("Microsoft.Storage/storageAccounts");
    REQUIRE(storage != nullptr);
    CHECK(storage->LatestVersion() == "2023-01-01");
}

TEST_CASE("LoadSchemaTree: missing file is a configuration error", "[discovery][schema]") {
    auto tree = LoadSchemaTree("/nonexistent/armschema.json");
    REQUIRE(tree.IsErr());
    CHECK(tree.Error().category == ErrorCategory::Configuration);
}
