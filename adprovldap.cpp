/*
 *----------------------------------------------------------------------------
 *
 * adprovldap.cpp
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

#include "adprov.h"
#include <sstream>

template<typename T, size_t N>
T * myend(T (&ra)[N]) {
    return ra + N;
}


std::string get_base_dn(const std::string &domain)
{
    std::string out;

    bool first = true;
    size_t last_pos = 0;
    do {
        size_t pos = domain.find('.', last_pos);
        if (first) {
            out.append("DC=");
            first = false;
        } else
            out.append(",DC=");
        out.append(domain.substr(last_pos, pos - last_pos));
        last_pos = pos + 1;
    } while (last_pos != 0);

    return out;
}


std::vector<std::string> split_ou_path(const std::string &ou_path)
{
    std::vector<std::string> segments;
    std::stringstream ss(ou_path);
    std::string segment;
    while (std::getline(ss, segment, '/')) {
        size_t begin = segment.find_first_not_of(" \t");
        if (begin == std::string::npos) {
            continue;
        }
        size_t end = segment.find_last_not_of(" \t");
        segments.push_back(segment.substr(begin, end - begin + 1));
    }
    return segments;
}


std::string resolve_container_dn(const DirectoryConfig &config)
{
    if (!config.users_ou_dn.empty()) {
        return config.users_ou_dn;
    }

    std::string base_dn = config.base_dn();
    std::vector<std::string> ou_parts = split_ou_path(config.ou_path);
    if (ou_parts.empty()) {
        return "CN=Users," + base_dn;
    }

    /* Innermost OU comes first in the DN */
    std::string dn;
    for (std::vector<std::string>::reverse_iterator it = ou_parts.rbegin();
         it != ou_parts.rend(); ++it) {
        dn += "OU=" + ldap_escape_dn_value(*it) + ",";
    }
    return dn + base_dn;
}


std::string ldap_escape_dn_value(const std::string &value)
{
    std::string out;
    for (size_t i = 0; i < value.size(); i++) {
        char c = value[i];
        switch (c) {
            case '\\':
            case ',':
            case '+':
            case ';':
            case '"':
            case '<':
            case '>':
            case '=':
                out += '\\';
                out += c;
                break;
            case '#':
                if (i == 0) {
                    out += '\\';
                }
                out += c;
                break;
            case ' ':
                if (i == 0 || i == value.size() - 1) {
                    out += '\\';
                }
                out += c;
                break;
            default:
                out += c;
        }
    }
    return out;
}


std::string ldap_escape_filter_value(const std::string &value)
{
    std::string out;
    for (size_t i = 0; i < value.size(); i++) {
        switch (value[i]) {
            case '*':
                out += "\\2a";
                break;
            case '(':
                out += "\\28";
                break;
            case ')':
                out += "\\29";
                break;
            case '\\':
                out += "\\5c";
                break;
            case '\0':
                out += "\\00";
                break;
            default:
                out += value[i];
        }
    }
    return out;
}


/* Returns the DN of the account with the given login, or an empty string. */
std::string ldap_find_account(DirectorySession &session,
                              const std::string &base_dn,
                              const std::string &login_name)
{
    std::string filter = sform("(sAMAccountName=%s)",
                               ldap_escape_filter_value(login_name).c_str());
    std::vector<std::string> attrs(1, "distinguishedName");

    VERBOSE("Checking that an account for %s exists", login_name.c_str());
    std::vector<DirectoryEntry> entries;
    try {
        entries = session.search(base_dn, LDAP_SCOPE_SUBTREE, filter, attrs);
    } catch (LDAPException &e) {
        std::string message = sform("Account lookup failed: %s",
                                    ldap_err2string(e.err()));
        if (!e.diagnostic().empty()) {
            message += ": " + e.diagnostic();
        }
        throw ProvisioningError(PROVISIONING_DIRECTORY_ERROR, message);
    }

    if (entries.empty()) {
        VERBOSE("Checking account - not found");
        return "";
    }

    std::string dn = entries[0].get_one_val("distinguishedName");
    if (dn.empty()) {
        dn = entries[0].dn();
    }
    VERBOSE("Checking account - found %s", dn.c_str());
    return dn;
}


/* AD reports a duplicate sAMAccountName either as entryAlreadyExists or as
 * a constraint violation carrying ERROR_USER_EXISTS (0x524). */
static bool is_already_exists(int err, const std::string &diagnostic)
{
    if (err == LDAP_ALREADY_EXISTS) {
        return true;
    }
    if (err == LDAP_CONSTRAINT_VIOLATION &&
        (diagnostic.find("00000524") != std::string::npos ||
         diagnostic.find("ENTRY_EXISTS") != std::string::npos)) {
        return true;
    }
    return false;
}


std::string ldap_create_account(DirectorySession &session,
                                const DirectoryConfig &config,
                                const std::string &container_dn,
                                const PersonIdentity &identity)
{
    const char *vals_objectClass[] = {"top",
                                      "person",
                                      "organizationalPerson",
                                      "user"};

    std::vector<std::string> v_user_objectClass(vals_objectClass,
                                                myend(vals_objectClass));

    std::string display_name = identity.display_name();
    std::string dn = sform("CN=%s,%s",
                           ldap_escape_dn_value(display_name).c_str(),
                           container_dn.c_str());

    VERBOSE("Account not found, create the account");
    fprintf(stdout, "No account for %s found, creating a new one.\n",
            identity.login_name.c_str());
    VERBOSE("Creating %s", dn.c_str());

    LDAP_mod mod_attrs;
    mod_attrs.add("objectClass", v_user_objectClass);
    mod_attrs.add("cn", display_name);
    mod_attrs.add("givenName", identity.given_name);
    mod_attrs.add("sn", identity.surname);
    mod_attrs.add("displayName", display_name);
    mod_attrs.add("sAMAccountName", identity.login_name);
    mod_attrs.add("userPrincipalName",
                  identity.login_name + "@" + config.domain);
    mod_attrs.add("mail", identity.email_address);
    if (!identity.telephone.empty()) {
        mod_attrs.add("telephoneNumber", identity.telephone);
    }

    /* Created disabled; enabled once the password is in place */
    mod_attrs.add("userAccountControl",
                  sform("%d", UF_NORMAL_ACCOUNT | UF_ACCOUNTDISABLE));

    try {
        session.add(dn, mod_attrs);
    } catch (LDAPException &e) {
        std::string reason = ldap_err2string(e.err());
        if (!e.diagnostic().empty()) {
            reason += ": " + e.diagnostic();
        }
        if (is_already_exists(e.err(), e.diagnostic())) {
            throw ProvisioningError(PROVISIONING_ALREADY_EXISTS,
                                    sform("User already exists: %s (%s)",
                                          identity.login_name.c_str(),
                                          reason.c_str()));
        }
        throw ProvisioningError(PROVISIONING_CREATE_REJECTED,
                                sform("Create user failed: %s", reason.c_str()));
    }
    return dn;
}


void ldap_enable_account(DirectorySession &session, const std::string &dn)
{
    VERBOSE("Setting userAccountControl to 0x%x", UF_NORMAL_ACCOUNT);
    int ret = session.simple_set_attr(dn, "userAccountControl",
                                      sform("%d", UF_NORMAL_ACCOUNT));
    if (ret != LDAP_SUCCESS) {
        std::string reason = ldap_err2string(ret);
        std::string diag = session.diagnostic_message();
        if (!diag.empty()) {
            reason += ": " + diag;
        }
        throw ProvisioningError(PROVISIONING_ENABLE_FAILED,
                                sform("Enable account failed: %s", reason.c_str()));
    }
}


void ldap_verify_account_enabled(DirectorySession &session, const std::string &dn)
{
    std::vector<std::string> attrs(1, "userAccountControl");
    std::vector<DirectoryEntry> entries;
    try {
        entries = session.search(dn, LDAP_SCOPE_BASE, "(objectClass=user)", attrs);
    } catch (LDAPException &e) {
        throw ProvisioningError(PROVISIONING_VERIFY_MISMATCH,
                                sform("Could not verify user after creation: %s",
                                      ldap_err2string(e.err())));
    }
    if (entries.empty()) {
        throw ProvisioningError(PROVISIONING_VERIFY_MISMATCH,
                                "Could not verify user after creation.");
    }

    std::string uac_str = entries[0].get_one_val("userAccountControl");
    char *end = NULL;
    unsigned long uac = strtoul(uac_str.c_str(), &end, 10);
    if (uac_str.empty() || *end != '\0') {
        throw ProvisioningError(PROVISIONING_VERIFY_MISMATCH,
                                sform("Could not verify user after creation "
                                      "(userAccountControl=%s)",
                                      uac_str.c_str()));
    }
    VERBOSE("Found userAccountControl = 0x%lx", uac);
    if (uac & UF_ACCOUNTDISABLE) {
        throw ProvisioningError(PROVISIONING_VERIFY_MISMATCH,
                                sform("User created but still disabled "
                                      "(userAccountControl=%lu)", uac));
    }
}
