/*
 *----------------------------------------------------------------------------
 *
 * directory.h
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

#ifndef DIRECTORY_H
#define DIRECTORY_H 1

#include <map>
#include <string>
#include <vector>

class DirectoryConfig;
class LDAP_mod;

/* One entry returned by a search. Attribute names are matched
 * case-insensitively, as the directory does. */
class DirectoryEntry {
    std::string m_dn;
    std::map<std::string, std::vector<std::string> > m_attrs;

    static std::string key(const std::string &name);
public:
    DirectoryEntry() {}
    explicit DirectoryEntry(const std::string &dn) : m_dn(dn) {}

    const std::string &dn() const { return m_dn; }
    void set_dn(const std::string &dn) { m_dn = dn; }

    void add_value(const std::string &name, const std::string &val);
    void set_value(const std::string &name, const std::string &val);
    bool has_attr(const std::string &name) const;
    std::string get_one_val(const std::string &name) const;
    std::vector<std::string> get_all_vals(const std::string &name) const;
};


/* An authenticated connection to the directory, owned by exactly one
 * provisioning call. */
class DirectorySession {
public:
    virtual ~DirectorySession() {}

    /* Throws LDAPException on failure. */
    virtual std::vector<DirectoryEntry> search(
                const std::string &base_dn, int scope, const std::string &filter,
                const std::vector<std::string> &attrs) = 0;

    /* Throws LDAPException on failure. */
    virtual void add(const std::string &dn, const LDAP_mod &mod) = 0;

    /* Modifications return the LDAP result code. */
    virtual int simple_set_attr(const std::string &dn, const std::string &type,
                                const std::string &val) = 0;
    virtual int set_binary_attr(const std::string &dn, const std::string &type,
                                const std::string &val) = 0;

    /* Server-supplied text for the last failed operation, if any. */
    virtual std::string diagnostic_message() = 0;

    virtual void close() = 0;
};


class DirectoryConnector {
public:
    virtual ~DirectoryConnector() {}

    /* Returns an open, bound session or throws ConnectionError. */
    virtual DirectorySession *connect(const DirectoryConfig &config) = 0;
};

#endif
