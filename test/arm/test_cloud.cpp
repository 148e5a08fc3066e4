#include <catch2/catch_test_macros.hpp>

#include <azlist/arm/cloud.hpp>

using namespace azlist;

TEST_CASE("ParseCloudEnvironment: known names, any case", "[arm][cloud]") {
    auto pub = ParseCloudEnvironment("Public");
    REQUIRE(pub.IsOk());
    CHECK(pub.Value() == CloudEnvironment::Public);

    auto china = ParseCloudEnvironment("china");
    REQUIRE(china.IsOk());
    CHECK(china.Value() == CloudEnvironment::China);

    auto gov = ParseCloudEnvironment("USGOVERNMENT");
    REQUIRE(gov.IsOk());
    CHECK(gov.Value() == CloudEnvironment::UsGovernment);
}

TEST_CASE("ParseCloudEnvironment: unknown name is a configuration error", "[arm][cloud]") {
    auto r = ParseCloudEnvironment("germany");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Configuration);
    CHECK(r.Error().message.find("germany") != std::string::npos);
}

TEST_CASE("ResourceManagerEndpoint: per cloud", "[arm][cloud]") {
    CHECK(ResourceManagerEndpoint(CloudEnvironment::Public) == "https://management.azure.com");
    CHECK(ResourceManagerEndpoint(CloudEnvironment::China) ==
          "https://management.chinacloudapi.cn");
    CHECK(ResourceManagerEndpoint(CloudEnvironment::UsGovernment) ==
          "https://management.usgovcloudapi.net");
    CHECK(CloudEnvironmentName(CloudEnvironment::China) == "china");
}
