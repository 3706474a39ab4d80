/*
 *----------------------------------------------------------------------------
 *
 * ldapconnection.h
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

#ifndef LDAPCONNECTION_H
#define LDAPCONNECTION_H 1

#include <ldap.h>
#include <string>
#include <vector>

#include "directory.h"

class LDAP_mod {
    std::vector<LDAPMod *> attrs;

    // make it non copyable
    LDAP_mod(const LDAP_mod&);
    const LDAP_mod& operator=(const LDAP_mod&);
public:
    LDAP_mod() {}
    void add(const std::string& type, const std::string& val);
    void add(const std::string& type, const std::vector<std::string>& val);
    void add_binary(const std::string& type, const std::string& val);
    std::vector<LDAPMod *> get() const;
    ~LDAP_mod();
};


class LDAPConnection : public DirectorySession {
private:
    LDAP *m_ldap;

    int modify_ext(const std::string &dn, const std::string& type, char *vals[], int op);
    int modify_ext(const std::string &dn, const std::string& type, BerValue *vals[], int op);
    void fail(connection_error_kind kind, const char *what, int err);

    // make it non copyable
    LDAPConnection(const LDAPConnection&);
    const LDAPConnection& operator=(const LDAPConnection&);

public:
    explicit LDAPConnection(const DirectoryConfig &config);
    void set_option(int option, const void *invalue);

    bool is_connected() const { return m_ldap != NULL; };

    std::vector<DirectoryEntry> search(
                const std::string &base_dn, int scope, const std::string &filter,
                const std::vector<std::string> &attrs);

    void add(const std::string &dn, const LDAP_mod& mod);
    int simple_set_attr(const std::string &dn, const std::string &type,
                        const std::string &val);
    int set_binary_attr(const std::string &dn, const std::string &type,
                        const std::string &val);

    void print_diagnostics(const char *msg, int err);
    std::string diagnostic_message();
    void close();
    ~LDAPConnection();
};


class LDAPConnector : public DirectoryConnector {
public:
    DirectorySession *connect(const DirectoryConfig &config);
};


/* Classify a libldap result code from connection setup or bind.
 * `diagnostic' is the session's LDAP_OPT_DIAGNOSTIC_MESSAGE, if any. */
extern connection_error_kind classify_connect_error(transport_mode transport,
                                                    int err, bool binding,
                                                    const std::string &diagnostic = "");

#endif
