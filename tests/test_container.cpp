/*
 *----------------------------------------------------------------------------
 *
 * test_container.cpp
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
#include <string>

#include "adprov.h"

// =============================================================================
// Test Suite: base DN and container resolution
// =============================================================================

class ContainerDnTest : public ::testing::Test {
protected:
    DirectoryConfig config;

    void SetUp() override {
        config.domain = "corp.local";
    }
};

TEST_F(ContainerDnTest, BaseDnFromDomain) {
    EXPECT_EQ(get_base_dn("corp.local"), "DC=corp,DC=local");
    EXPECT_EQ(get_base_dn("eu.corp.example.com"), "DC=eu,DC=corp,DC=example,DC=com");
    EXPECT_EQ(get_base_dn("localdomain"), "DC=localdomain");
}

TEST_F(ContainerDnTest, DefaultUsersContainer) {
    EXPECT_EQ(resolve_container_dn(config), "CN=Users,DC=corp,DC=local");
}

TEST_F(ContainerDnTest, OuPathInnermostFirst) {
    config.ou_path = "Employees/NewHires";
    EXPECT_EQ(resolve_container_dn(config), "OU=NewHires,OU=Employees,DC=corp,DC=local");
}

TEST_F(ContainerDnTest, SingleOu) {
    config.ou_path = "Employees";
    EXPECT_EQ(resolve_container_dn(config), "OU=Employees,DC=corp,DC=local");
}

TEST_F(ContainerDnTest, UsersOuWinsOverOuPath) {
    config.users_ou_dn = "OU=Staff,OU=People,DC=corp,DC=local";
    config.ou_path = "Employees/NewHires";
    EXPECT_EQ(resolve_container_dn(config), "OU=Staff,OU=People,DC=corp,DC=local");

    config.ou_path = "";
    EXPECT_EQ(resolve_container_dn(config), "OU=Staff,OU=People,DC=corp,DC=local");
}

TEST_F(ContainerDnTest, BlankSegmentsDropped) {
    config.ou_path = "/Employees// NewHires /";
    EXPECT_EQ(resolve_container_dn(config), "OU=NewHires,OU=Employees,DC=corp,DC=local");

    config.ou_path = " / ";
    EXPECT_EQ(resolve_container_dn(config), "CN=Users,DC=corp,DC=local");
}

TEST_F(ContainerDnTest, OuSegmentsEscaped) {
    config.ou_path = "R&D, Labs/Team+1";
    EXPECT_EQ(resolve_container_dn(config),
              "OU=Team\\+1,OU=R&D\\, Labs,DC=corp,DC=local");
}

TEST_F(ContainerDnTest, Deterministic) {
    config.ou_path = "Employees/NewHires";
    std::string first = resolve_container_dn(config);
    for (int i = 0; i < 5; i++) {
        EXPECT_EQ(resolve_container_dn(config), first);
    }
}

TEST(SplitOuPathTest, Segments) {
    std::vector<std::string> parts = split_ou_path("A/B/C");
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "A");
    EXPECT_EQ(parts[1], "B");
    EXPECT_EQ(parts[2], "C");

    EXPECT_TRUE(split_ou_path("").empty());
}

// =============================================================================
// Test Suite: escaping
// =============================================================================

TEST(LdapEscapeTest, DnValue) {
    EXPECT_EQ(ldap_escape_dn_value("John Doe"), "John Doe");
    EXPECT_EQ(ldap_escape_dn_value("Doe, John"), "Doe\\, John");
    EXPECT_EQ(ldap_escape_dn_value("a=b+c;d"), "a\\=b\\+c\\;d");
    EXPECT_EQ(ldap_escape_dn_value("\"q\" <x>"), "\\\"q\\\" \\<x\\>");
    EXPECT_EQ(ldap_escape_dn_value("back\\slash"), "back\\\\slash");
    EXPECT_EQ(ldap_escape_dn_value("#1 fan"), "\\#1 fan");
    EXPECT_EQ(ldap_escape_dn_value("no#1"), "no#1");
    EXPECT_EQ(ldap_escape_dn_value(" padded "), "\\ padded\\ ");
}

TEST(LdapEscapeTest, FilterValue) {
    EXPECT_EQ(ldap_escape_filter_value("johndoe"), "johndoe");
    EXPECT_EQ(ldap_escape_filter_value("*"), "\\2a");
    EXPECT_EQ(ldap_escape_filter_value("a(b)c"), "a\\28b\\29c");
    EXPECT_EQ(ldap_escape_filter_value("x\\y"), "x\\5cy");
    EXPECT_EQ(ldap_escape_filter_value(std::string("n\0l", 3)), "n\\00l");
}
