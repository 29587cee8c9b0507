#include <gtest/gtest.h>
#include <snmpcore/security/credential_utils.h>

#include <algorithm>
#include <cctype>
#include <set>
#include <string>

using namespace snmpcore::v1;
using namespace snmpcore::v1::security;

class CredentialUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        v2c_ = Credentials::from_community("n0c-Monitor_42");

        v3_.username = "poller";
        v3_.auth_protocol = AuthProtocol::SHA;
        v3_.auth_key = "authpassphrase";
        v3_.priv_protocol = PrivProtocol::AES;
        v3_.priv_key = "privpassphrase";
    }

    Credentials v2c_;
    Credentials v3_;
};

TEST_F(CredentialUtilsTest, FingerprintIsStableAndOpaque) {
    auto a = CredentialUtils::credential_fingerprint("Router-1", SnmpVersion::V2C, 161, v2c_);
    auto b = CredentialUtils::credential_fingerprint("router-1", SnmpVersion::V2C, 161, v2c_);
    ASSERT_TRUE(a.is_success());
    ASSERT_TRUE(b.is_success());

    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(a.value().size(), 16u);
    EXPECT_TRUE(std::all_of(a.value().begin(), a.value().end(),
                            [](unsigned char c) { return std::isxdigit(c); }));
    EXPECT_EQ(a.value().find("n0c"), std::string::npos);
}

TEST_F(CredentialUtilsTest, FingerprintSeparatesCredentials) {
    std::set<std::string> prints;
    prints.insert(CredentialUtils::credential_fingerprint("r1", SnmpVersion::V2C, 161, v2c_).value());
    prints.insert(CredentialUtils::credential_fingerprint("r1", SnmpVersion::V2C, 1161, v2c_).value());
    prints.insert(CredentialUtils::credential_fingerprint("r1", SnmpVersion::V1, 161, v2c_).value());
    prints.insert(CredentialUtils::credential_fingerprint(
        "r1", SnmpVersion::V2C, 161, Credentials::from_community("other")).value());
    prints.insert(CredentialUtils::credential_fingerprint("r1", SnmpVersion::V3, 161, v3_).value());

    Credentials rekeyed = v3_;
    rekeyed.priv_key = "anotherpassphrase";
    prints.insert(CredentialUtils::credential_fingerprint("r1", SnmpVersion::V3, 161, rekeyed).value());

    EXPECT_EQ(prints.size(), 6u);
}

TEST_F(CredentialUtilsTest, RedactsEveryForm) {
    const std::string json = R"({"host":"r1","community":"topsecret","authKey":"k1"})";
    auto redacted = CredentialUtils::redact_sensitive_data(json);
    EXPECT_EQ(redacted.find("topsecret"), std::string::npos);
    EXPECT_EQ(redacted.find("k1"), std::string::npos);
    EXPECT_NE(redacted.find(R"("community":"[REDACTED]")"), std::string::npos);
    EXPECT_NE(redacted.find(R"("host":"r1")"), std::string::npos);

    EXPECT_EQ(CredentialUtils::redact_sensitive_data("open community=topsecret&port=161"),
              "open community=[REDACTED]&port=161");
    EXPECT_EQ(CredentialUtils::redact_sensitive_data("password: hunter2, host: r1"),
              "password: [REDACTED], host: r1");
    EXPECT_EQ(CredentialUtils::redact_sensitive_data("nothing to hide"), "nothing to hide");
}

TEST_F(CredentialUtilsTest, JsonValuesRedactedWithSpacing) {
    EXPECT_EQ(CredentialUtils::redact_sensitive_data(R"({"passphrase" : "pp-9", "token":"t0k"})"),
              R"({"passphrase" : "[REDACTED]", "token":"[REDACTED]"})");
    EXPECT_EQ(CredentialUtils::redact_sensitive_data(R"({"PrivKey":"des-key","port":161})"),
              R"({"PrivKey":"[REDACTED]","port":161})");
}

TEST_F(CredentialUtilsTest, CommunityStrength) {
    auto weak = CredentialUtils::assess_community_strength("public");
    EXPECT_TRUE(weak.valid);
    EXPECT_EQ(weak.strength, CredentialStrength::MODERATE);
    EXPECT_FALSE(weak.warnings.empty());

    auto tiny = CredentialUtils::assess_community_strength("abc");
    EXPECT_EQ(tiny.strength, CredentialStrength::WEAK);

    auto strong = CredentialUtils::assess_community_strength("n0c-Monitor_42");
    EXPECT_TRUE(strong.valid);
    EXPECT_EQ(strong.strength, CredentialStrength::STRONG);
    EXPECT_TRUE(strong.warnings.empty());

    auto guessable = CredentialUtils::assess_community_strength("mytest123");
    EXPECT_FALSE(guessable.warnings.empty());

    auto invalid = CredentialUtils::assess_community_strength("has space");
    EXPECT_FALSE(invalid.valid);
    EXPECT_FALSE(invalid.errors.empty());

    EXPECT_FALSE(CredentialUtils::assess_community_strength("").valid);
    EXPECT_STREQ(CredentialUtils::strength_to_string(CredentialStrength::STRONG), "strong");
}

TEST_F(CredentialUtilsTest, CredentialSecurityReport) {
    auto good = CredentialUtils::validate_credential_security(
        SnmpVersion::V2C, v2c_, std::chrono::milliseconds(5000), 3);
    EXPECT_TRUE(good.secure);
    EXPECT_TRUE(good.recommendations.empty());

    auto v1 = CredentialUtils::validate_credential_security(
        SnmpVersion::V1, Credentials::from_community("public"), std::chrono::milliseconds(45000), 8);
    EXPECT_TRUE(v1.secure);
    EXPECT_GE(v1.recommendations.size(), 4u);

    Credentials no_user;
    auto v3 = CredentialUtils::validate_credential_security(
        SnmpVersion::V3, no_user, std::chrono::milliseconds(5000), 1);
    EXPECT_FALSE(v3.secure);
}

TEST_F(CredentialUtilsTest, SafeMessages) {
    auto message = CredentialUtils::safe_error_message(
        "open failed community=abc123", {{"community", "abc123"}, {"host", "r1"}});
    EXPECT_EQ(message.find("abc123"), std::string::npos);
    EXPECT_NE(message.find("\"host\":\"r1\""), std::string::npos);

    EXPECT_EQ(CredentialUtils::safe_description(SnmpVersion::V2C, v2c_),
              "v2c community=[REDACTED]");
    auto v3 = CredentialUtils::safe_description(SnmpVersion::V3, v3_);
    EXPECT_NE(v3.find("user=poller"), std::string::npos);
    EXPECT_EQ(v3.find("passphrase"), std::string::npos);
}

TEST_F(CredentialUtilsTest, GeneratedCommunitiesAreValid) {
    auto generated = CredentialUtils::generate_secure_community(24);
    ASSERT_TRUE(generated.is_success());
    EXPECT_EQ(generated.value().size(), 24u);
    EXPECT_TRUE(CredentialUtils::assess_community_strength(generated.value()).valid);

    auto other = CredentialUtils::generate_secure_community(24);
    ASSERT_TRUE(other.is_success());
    EXPECT_NE(generated.value(), other.value());

    EXPECT_EQ(CredentialUtils::generate_secure_community(0).error(), SNMPError::INVALID_PARAMETER);
    EXPECT_EQ(CredentialUtils::generate_secure_community(33).error(), SNMPError::INVALID_PARAMETER);
}
