/*
 *----------------------------------------------------------------------------
 *
 * test_connector.cpp
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
#include <memory>
#include <string>

#include "adprov.h"

// =============================================================================
// Test Suite: classification of connect and bind failures
// =============================================================================

TEST(ClassifyConnectErrorTest, BindRejections) {
    EXPECT_EQ(classify_connect_error(TRANSPORT_LDAPS, LDAP_INVALID_CREDENTIALS, true),
              CONNECTION_AUTHENTICATION_REJECTED);
    EXPECT_EQ(classify_connect_error(TRANSPORT_PLAIN, LDAP_STRONG_AUTH_REQUIRED, true),
              CONNECTION_AUTHENTICATION_REJECTED);
    EXPECT_EQ(classify_connect_error(TRANSPORT_STARTTLS, LDAP_UNWILLING_TO_PERFORM, true),
              CONNECTION_AUTHENTICATION_REJECTED);
}

TEST(ClassifyConnectErrorTest, NetworkFailures) {
    // Without a TLS reason an ldaps server-down is the socket
    EXPECT_EQ(classify_connect_error(TRANSPORT_LDAPS, LDAP_SERVER_DOWN, true),
              CONNECTION_NETWORK_UNREACHABLE);
    EXPECT_EQ(classify_connect_error(TRANSPORT_STARTTLS, LDAP_SERVER_DOWN, false),
              CONNECTION_NETWORK_UNREACHABLE);
    EXPECT_EQ(classify_connect_error(TRANSPORT_PLAIN, LDAP_SERVER_DOWN, true,
                                     "connection reset"),
              CONNECTION_NETWORK_UNREACHABLE);
    EXPECT_EQ(classify_connect_error(TRANSPORT_PLAIN, LDAP_TIMEOUT, true),
              CONNECTION_NETWORK_UNREACHABLE);
    EXPECT_EQ(classify_connect_error(TRANSPORT_PLAIN, LDAP_CONNECT_ERROR, true),
              CONNECTION_NETWORK_UNREACHABLE);
}

TEST(ClassifyConnectErrorTest, TlsFailures) {
    EXPECT_EQ(classify_connect_error(TRANSPORT_LDAPS, LDAP_CONNECT_ERROR, true),
              CONNECTION_TLS_NEGOTIATION_FAILED);
    // libldap reports a failed ldaps handshake during bind as server down
    EXPECT_EQ(classify_connect_error(TRANSPORT_LDAPS, LDAP_SERVER_DOWN, true,
                                     "error:0A000086:SSL routines::certificate verify failed"),
              CONNECTION_TLS_NEGOTIATION_FAILED);
    EXPECT_EQ(classify_connect_error(TRANSPORT_LDAPS, LDAP_SERVER_DOWN, true,
                                     "(unknown error code)"),
              CONNECTION_TLS_NEGOTIATION_FAILED);
    EXPECT_EQ(classify_connect_error(TRANSPORT_STARTTLS, LDAP_PROTOCOL_ERROR, false),
              CONNECTION_TLS_NEGOTIATION_FAILED);
    EXPECT_EQ(classify_connect_error(TRANSPORT_STARTTLS, LDAP_UNWILLING_TO_PERFORM, false),
              CONNECTION_TLS_NEGOTIATION_FAILED);
}

// =============================================================================
// Test Suite: LDAPConnector against an unreachable server
// =============================================================================

class UnreachableServerTest : public ::testing::Test {
protected:
    MapParameterStore store;

    void SetUp() override {
        // Nothing listens on port 1
        store.set(CONF_AD_SERVER, "127.0.0.1");
        store.set(CONF_DOMAIN, "corp.local");
        store.set(CONF_ADMIN_PASSWORD, "Adm1n!secret");
        store.set(CONF_LDAPS_PORT, "1");
        store.set(CONF_LDAP_PORT, "1");
        store.set(CONF_CONNECT_TIMEOUT, "2");
        store.set(CONF_PASSWORD_FALLBACK, "false");
    }
};

TEST_F(UnreachableServerTest, PlainConnectThrowsNetworkUnreachable) {
    store.set(CONF_LDAP_SECURE, "plain");
    DirectoryConfig config = resolve_config(store);
    LDAPConnector connector;
    try {
        std::unique_ptr<DirectorySession> session(connector.connect(config));
        FAIL() << "connected to a closed port";
    } catch (ConnectionError &e) {
        EXPECT_EQ(e.kind(), CONNECTION_NETWORK_UNREACHABLE);
        EXPECT_EQ(std::string(e.what()).find("Adm1n!secret"), std::string::npos);
    }
}

TEST_F(UnreachableServerTest, StartTlsConnectFailsBeforeBind) {
    store.set(CONF_LDAP_SECURE, "starttls");
    DirectoryConfig config = resolve_config(store);
    LDAPConnector connector;
    EXPECT_THROW(std::unique_ptr<DirectorySession>(connector.connect(config)),
                 ConnectionError);
}

TEST_F(UnreachableServerTest, ProvisioningReportsConnectionError) {
    for (const char *mode : {"ldaps", "starttls", "plain"}) {
        store.set(CONF_LDAP_SECURE, mode);
        ProvisioningResult result = provision_account(
            store, make_person_identity("John Doe", "john.doe@corp.com"));

        EXPECT_FALSE(result.is_success()) << mode;
        EXPECT_EQ(result.error_family(), ERROR_CONNECTION) << mode;
        EXPECT_FALSE(result.has_initial_password()) << mode;
        EXPECT_EQ(result.error_message().find("already exists"), std::string::npos);
    }
}
