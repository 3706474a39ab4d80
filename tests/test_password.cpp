/*
 *----------------------------------------------------------------------------
 *
 * test_password.cpp
 *
 * (C) 2004-2006 Dan Perry (dperry@pppl.gov)
 * (C) 2006 Brian Elliott Finley (finley@anl.gov)
 * (C) 2009-2010 Doug Engert (deengert@anl.gov)
 * (C) 2010 James Y Knight (foom@fuhm.net)
 * (C) 2010-2013 Ken Dreyer <ktdreyer at ktdreyer.com>
 * (C) 2012-2017 Mark Proehl <mark at mproehl.net>
 * (C) 2012-2017 Olaf Flebbe <of at oflebbe.de>
 * (C) 2013-2017 Daniel Kobras <d.kobras at science-computing.de>
 *
    This program is free software; you can redistribute it and/or modify
    it under the terms of the GNU General Public License as published by
    the Free Software Foundation; either version 2 of the License, or
    (at your option) any later version.

    This program is distributed in the hope that it will be useful,
    but WITHOUT ANY WARRANTY; without even the implied warranty of
    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
    GNU General Public License for more details.

    You should have received a copy of the GNU General Public License
    along with this program; if not, write to the Free Software
    Foundation, Inc., 51 Franklin St, Fifth Floor, Boston, MA  02110-1301  USA
 *
 *-----------------------------------------------------------------------------
 */

#include <gtest/gtest.h>
#include <stdlib.h>
#include <string>
#include <unistd.h>

#include "adprov.h"
#include "fakedirectory.h"

// =============================================================================
// Test Suite: generated passwords
// =============================================================================

TEST(GeneratePasswordTest, LengthAndCharacterClasses) {
    for (int i = 0; i < 20; i++) {
        std::string password = generate_new_password(DEFAULT_PASSWORD_LEN, "johndoe");
        ASSERT_EQ(password.size(), (size_t) DEFAULT_PASSWORD_LEN);
        EXPECT_TRUE(password_is_complex(password));
        for (size_t j = 0; j < password.size(); j++) {
            EXPECT_GE((unsigned char) password[j], 33);
            EXPECT_LE((unsigned char) password[j], 126);
        }
    }
}

TEST(GeneratePasswordTest, HonoursConfiguredLength) {
    EXPECT_EQ(generate_new_password(MIN_PASSWORD_LEN, "x").size(), (size_t) MIN_PASSWORD_LEN);
    EXPECT_EQ(generate_new_password(MAX_PASSWORD_LEN, "x").size(), (size_t) MAX_PASSWORD_LEN);
}

TEST(GeneratePasswordTest, NeverContainsLoginName) {
    // A two-character login is likely to show up by chance if not excluded
    for (int i = 0; i < 50; i++) {
        std::string password = generate_new_password(MAX_PASSWORD_LEN, "aB");
        std::string folded = lower(password);
        EXPECT_EQ(folded.find("ab"), std::string::npos);
    }
}

TEST(GeneratePasswordTest, Distinct) {
    EXPECT_NE(generate_new_password(16, "johndoe"), generate_new_password(16, "johndoe"));
}

TEST(PasswordComplexityTest, Classes) {
    EXPECT_TRUE(password_is_complex("aB3$"));
    EXPECT_FALSE(password_is_complex("ab3$"));
    EXPECT_FALSE(password_is_complex("AB3$"));
    EXPECT_FALSE(password_is_complex("aBc$"));
    EXPECT_FALSE(password_is_complex("aB3c"));
    EXPECT_FALSE(password_is_complex(""));
}

TEST(PasswordWipeTest, ClearsBuffer) {
    std::string password = "S3cret!pw";
    wipe_password(password);
    EXPECT_TRUE(password.empty());
}

// =============================================================================
// Test Suite: unicodePwd encoding
// =============================================================================

TEST(UnicodePwdTest, QuotedUtf16le) {
    EXPECT_EQ(encode_unicode_pwd("ab"), std::string("\"\0a\0b\0\"\0", 8));
}

TEST(UnicodePwdTest, NonAscii) {
    // U+00E9
    EXPECT_EQ(transcode_utf8_utf16le("\xc3\xa9"), std::string("\xe9\x00", 2));
    // U+20AC
    EXPECT_EQ(transcode_utf8_utf16le("\xe2\x82\xac"), std::string("\xac\x20", 2));
    // U+1F600 needs a surrogate pair
    EXPECT_EQ(transcode_utf8_utf16le("\xf0\x9f\x98\x80"),
              std::string("\x3d\xd8\x00\xde", 4));
}

TEST(UnicodePwdTest, InvalidUtf8Replaced) {
    EXPECT_EQ(transcode_utf8_utf16le("\xff"), std::string("\xfd\xff", 2));
}

// =============================================================================
// Test Suite: password strategies
// =============================================================================

class PasswordSetterTest : public ::testing::Test {
protected:
    FakeDirectory dir;
    const std::string dn = "CN=John Doe,CN=Users,DC=corp,DC=local";

    void SetUp() override {
        dir.add_existing_user(dn, "johndoe", "514");
    }
};

TEST_F(PasswordSetterTest, UnicodePwdWritesEncodedPassword) {
    FakeSession session(dir);
    UnicodePwdSetter setter;
    std::string diagnostic;

    EXPECT_TRUE(setter.set_password(session, dn, "johndoe", "S3cret!pw", diagnostic));
    ASSERT_EQ(dir.unicode_pwds.size(), 1u);
    EXPECT_EQ(dir.unicode_pwds[0], encode_unicode_pwd("S3cret!pw"));
    EXPECT_TRUE(diagnostic.empty());
}

TEST_F(PasswordSetterTest, UnicodePwdReportsServerReason) {
    dir.password_error = LDAP_UNWILLING_TO_PERFORM;
    dir.password_diagnostic = "0000001F: SvcErr: DSID-031A12D2, problem 5003";
    FakeSession session(dir);
    UnicodePwdSetter setter;
    std::string diagnostic;

    EXPECT_FALSE(setter.set_password(session, dn, "johndoe", "S3cret!pw", diagnostic));
    EXPECT_NE(diagnostic.find(ldap_err2string(LDAP_UNWILLING_TO_PERFORM)), std::string::npos);
    EXPECT_NE(diagnostic.find("problem 5003"), std::string::npos);
    EXPECT_EQ(diagnostic.find("S3cret!pw"), std::string::npos);
}

TEST_F(PasswordSetterTest, KpasswdNeedsPrincipalAdmin) {
    DirectoryConfig config;
    config.server = "dc1.corp.local";
    config.domain = "corp.local";
    config.admin_user = "CN=Onboard,CN=Users,DC=corp,DC=local";
    config.admin_password = "Adm1n!secret";
    FakeSession session(dir);
    KpasswdResetSetter setter(config);
    std::string diagnostic;

    EXPECT_FALSE(setter.set_password(session, dn, "johndoe", "S3cret!pw", diagnostic));
    EXPECT_NE(diagnostic.find("DN"), std::string::npos);
    EXPECT_STREQ(setter.name(), "kpasswd");
}

TEST_F(PasswordSetterTest, KpasswdLeavesEnvironmentAlone) {
    const char *saved = getenv("KRB5_CONFIG");
    std::string saved_value = saved ? saved : "";
    setenv("KRB5_CONFIG", "/nonexistent/adprov-krb5.conf", 1);

    // Nothing serves Kerberos on the loopback address
    DirectoryConfig config;
    config.server = "127.0.0.1";
    config.domain = "corp.local";
    config.admin_user = "administrator@corp.local";
    config.admin_password = "Adm1n!secret";
    FakeSession session(dir);
    KpasswdResetSetter setter(config);
    std::string diagnostic;

    EXPECT_FALSE(setter.set_password(session, dn, "johndoe", "S3cret!pw", diagnostic));
    EXPECT_FALSE(diagnostic.empty());
    EXPECT_EQ(diagnostic.find("S3cret!pw"), std::string::npos);
    EXPECT_EQ(diagnostic.find("Adm1n!secret"), std::string::npos);
    ASSERT_NE(getenv("KRB5_CONFIG"), (const char *) NULL);
    EXPECT_STREQ(getenv("KRB5_CONFIG"), "/nonexistent/adprov-krb5.conf");

    if (saved) {
        setenv("KRB5_CONFIG", saved_value.c_str(), 1);
    } else {
        unsetenv("KRB5_CONFIG");
    }
}

// =============================================================================
// Test Suite: private Kerberos configuration
// =============================================================================

TEST(KRB5ConfFileTest, ContextReadsOnlyTheGivenFile) {
    std::string filename;
    {
        KRB5ConfFile conf("CORP.LOCAL", "dc1.corp.local");
        filename = conf.filename();
        EXPECT_EQ(access(filename.c_str(), R_OK), 0);

        KRB5Context context(conf.filename());
        EXPECT_EQ(context.default_realm(), "CORP.LOCAL");

        KRB5Principal principal(context, "johndoe");
        EXPECT_EQ(principal.name(), "johndoe@CORP.LOCAL");
    }
    EXPECT_NE(access(filename.c_str(), F_OK), 0);
}
