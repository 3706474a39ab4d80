/*
 *----------------------------------------------------------------------------
 *
 * ldapconnection.cpp
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

#include <sstream>
#include <cctype>
#include <sys/time.h>
#include "adprov.h"

#define VERBOSEldap(text...) if (g_verbose > 1) { fprintf(stderr, " ###### %s: ", __FUNCTION__); fprintf(stderr, ## text); fprintf(stderr, "\n"); }


connection_error_kind classify_connect_error(transport_mode transport,
                                             int err, bool binding,
                                             const std::string &diagnostic)
{
    switch (err) {
        case LDAP_INVALID_CREDENTIALS:
        case LDAP_INAPPROPRIATE_AUTH:
        case LDAP_STRONG_AUTH_REQUIRED:
        case LDAP_INSUFFICIENT_ACCESS:
        case LDAP_UNWILLING_TO_PERFORM:
        case LDAP_CONFIDENTIALITY_REQUIRED:
            return binding ? CONNECTION_AUTHENTICATION_REJECTED
                           : CONNECTION_TLS_NEGOTIATION_FAILED;
        case LDAP_CONNECT_ERROR:
            /* libldap reports a failed TLS handshake as a connect error;
             * with plain transport it can only be the socket. */
            if (transport == TRANSPORT_PLAIN) {
                return CONNECTION_NETWORK_UNREACHABLE;
            }
            return CONNECTION_TLS_NEGOTIATION_FAILED;
        case LDAP_SERVER_DOWN:
            /* With ldaps the handshake runs on the first operation. A failed
             * handshake leaves the TLS library's reason in ld_error, a
             * refused or unreachable socket leaves it empty. */
            if (transport == TRANSPORT_LDAPS && !diagnostic.empty()) {
                return CONNECTION_TLS_NEGOTIATION_FAILED;
            }
            return CONNECTION_NETWORK_UNREACHABLE;
        case LDAP_TIMEOUT:
        case LDAP_TIMELIMIT_EXCEEDED:
        case LDAP_UNAVAILABLE:
        case LDAP_BUSY:
            return CONNECTION_NETWORK_UNREACHABLE;
        default:
            if (!binding && transport != TRANSPORT_PLAIN) {
                return CONNECTION_TLS_NEGOTIATION_FAILED;
            }
            return binding ? CONNECTION_AUTHENTICATION_REJECTED
                           : CONNECTION_NETWORK_UNREACHABLE;
    }
}


LDAPConnection::LDAPConnection(const DirectoryConfig &config) :
        m_ldap()
{
    int ret = 0;
    std::string ldap_url = sform("%s://%s:%d",
                                 config.transport == TRANSPORT_LDAPS ? "ldaps" : "ldap",
                                 config.server.c_str(),
                                 config.port);
    VERBOSEldap("calling ldap_initialize");
    ret = ldap_initialize(&m_ldap, ldap_url.c_str());
    if (ret) {
        m_ldap = NULL;
        throw ConnectionError(CONNECTION_NETWORK_UNREACHABLE,
                              sform("Cannot initialize LDAP for %s (%s)",
                                    ldap_url.c_str(), ldap_err2string(ret)));
    }

#ifdef LDAP_OPT_DEBUG_LEVEL
    int debug = 0xffffff;
    if (g_verbose > 1) {
        ldap_set_option(NULL, LDAP_OPT_DEBUG_LEVEL, &debug);
    }
#endif

    int version = LDAP_VERSION3;

    VERBOSE("Connecting to LDAP server: %s (%s)",
            ldap_url.c_str(), transport_mode_name(config.transport));

    struct timeval timeout;
    timeout.tv_sec = config.connect_timeout;
    timeout.tv_usec = 0;

    try {
        set_option(LDAP_OPT_PROTOCOL_VERSION, &version);
        set_option(LDAP_OPT_REFERRALS, LDAP_OPT_OFF);
        set_option(LDAP_OPT_NETWORK_TIMEOUT, &timeout);
        set_option(LDAP_OPT_TIMEOUT, &timeout);

        if (config.transport != TRANSPORT_PLAIN) {
            int require_cert = LDAP_OPT_X_TLS_DEMAND;
            if (!config.validate_cert) {
                fprintf(stderr,
                        "Warning: TLS certificate validation is disabled for %s\n",
                        config.server.c_str());
                require_cert = LDAP_OPT_X_TLS_NEVER;
            }
            set_option(LDAP_OPT_X_TLS_REQUIRE_CERT, &require_cert);
            if (!config.ca_cert_file.empty()) {
                set_option(LDAP_OPT_X_TLS_CACERTFILE, config.ca_cert_file.c_str());
            }
            /* TLS options set on a handle only take effect in a fresh
             * context. */
            int is_server = 0;
            set_option(LDAP_OPT_X_TLS_NEWCTX, &is_server);
        }
    } catch (LDAPException &e) {
        VERBOSE("%s", e.what());
        fail(CONNECTION_TLS_NEGOTIATION_FAILED, "ldap_set_option", e.err());
    }

    if (config.transport == TRANSPORT_STARTTLS) {
        VERBOSEldap("calling ldap_start_tls_s");
        ret = ldap_start_tls_s(m_ldap, NULL, NULL);
        if (ret != LDAP_SUCCESS) {
            print_diagnostics("ldap_start_tls_s failed", ret);
            fail(classify_connect_error(config.transport, ret, false,
                                        diagnostic_message()),
                 "ldap_start_tls_s", ret);
        }
    }

    VERBOSEldap("calling ldap_sasl_bind_s as %s", config.admin_user.c_str());
    struct berval cred;
    cred.bv_val = const_cast<char *>(config.admin_password.c_str());
    cred.bv_len = config.admin_password.length();
    ret = ldap_sasl_bind_s(m_ldap, config.admin_user.c_str(), LDAP_SASL_SIMPLE,
                           &cred, NULL, NULL, NULL);
    if (ret) {
        print_diagnostics("ldap_sasl_bind_s failed", ret);
        fail(classify_connect_error(config.transport, ret, true,
                                    diagnostic_message()),
             "ldap_sasl_bind_s", ret);
    }
    VERBOSE("Bound to %s as %s", config.server.c_str(), config.admin_user.c_str());
}

/* Release the handle and report why the session could not be opened. */
void LDAPConnection::fail(connection_error_kind kind, const char *what, int err)
{
    std::string message;
    switch (kind) {
        case CONNECTION_NETWORK_UNREACHABLE:
            message = "Directory server unreachable";
            break;
        case CONNECTION_TLS_NEGOTIATION_FAILED:
            message = "TLS negotiation with directory server failed";
            break;
        case CONNECTION_AUTHENTICATION_REJECTED:
            message = "Directory server rejected the administrator credentials";
            break;
    }
    message += sform(": %s (%s)", what, ldap_err2string(err));
    std::string diag = diagnostic_message();
    if (!diag.empty()) {
        message += ": " + diag;
    }
    close();
    throw ConnectionError(kind, message);
}

void LDAPConnection::print_diagnostics(const char *msg, int err)
{
    fprintf(stderr, "Error: %s (%s)\n", msg, ldap_err2string(err));

    std::string diag = diagnostic_message();
    if (!diag.empty()) {
        fprintf(stderr, "\tadditional info: %s\n", diag.c_str());
    }
}

std::string LDAPConnection::diagnostic_message()
{
    std::string result;
#if HAVE_DECL_LDAP_OPT_DIAGNOSTIC_MESSAGE
    if (!m_ldap) {
        return result;
    }
    char *opt_message = NULL;
    ldap_get_option(m_ldap, LDAP_OPT_DIAGNOSTIC_MESSAGE, &opt_message);
    if (opt_message) {
        result = opt_message;
    }
    ldap_memfree(opt_message);
#endif
    return result;
}

void LDAPConnection::set_option(int option, const void *invalue)
{
    int ret = ldap_set_option(m_ldap, option, invalue);
    if (ret) {
        std::stringstream ss;
        ss << "ldap_set_option (option=" << option << ") ";
        throw LDAPException(ss.str(), ret);
    }
}

void LDAPConnection::close()
{
    if (m_ldap) {
        VERBOSE("Disconnecting from LDAP server");
        ldap_unbind_ext(m_ldap, NULL, NULL);
        m_ldap = NULL;
    }
}

LDAPConnection::~LDAPConnection() {
    close();
}

class MessageVals
{
    berval** m_vals;
public:
    MessageVals(berval **vals) :
            m_vals(vals) {
    }
    ~MessageVals() {
        if (m_vals)
            ldap_value_free_len(m_vals);
    }
    BerValue *&
    operator [](size_t off) {
        return m_vals[off];
    }
    operator bool() {
        return m_vals;
    }
};

class Message
{
    LDAPMessage *m_mesg;
public:
    Message() : m_mesg(NULL) {}
    ~Message() {
        if (m_mesg)
            ldap_msgfree(m_mesg);
    }
    LDAPMessage **out() {
        return &m_mesg;
    }
    LDAPMessage *get() {
        return m_mesg;
    }
};

std::vector<DirectoryEntry>
LDAPConnection::search(const std::string &base_dn, int scope,
        const std::string &filter, const std::vector<std::string>& attr)
{
    std::vector<char *> v_chptr;
    for (unsigned int i = 0; i < attr.size(); i++) {
        char *p = const_cast<char *>(attr[i].c_str());
        v_chptr.push_back(p);
    }
    v_chptr.push_back(NULL);

    Message mesg;
    VERBOSEldap("calling ldap_search_ext_s");
    VERBOSEldap("ldap_search_ext_s base context: %s", base_dn.c_str());
    VERBOSEldap("ldap_search_ext_s filter: %s", filter.c_str());
    int ret = ldap_search_ext_s(m_ldap, base_dn.c_str(), scope, filter.c_str(),
            &v_chptr[0], 0, NULL, NULL, NULL, -1, mesg.out());

    if (ret == LDAP_NO_SUCH_OBJECT) {
        VERBOSE("Search base %s does not exist", base_dn.c_str());
        return std::vector<DirectoryEntry>();
    }
    if (ret) {
        print_diagnostics("ldap_search_ext_s failed", ret);
        throw LDAPException("ldap_search_ext_s", ret, diagnostic_message());
    }

    std::vector<DirectoryEntry> entries;
    for (LDAPMessage *entry = ldap_first_entry(m_ldap, mesg.get());
         entry != NULL;
         entry = ldap_next_entry(m_ldap, entry)) {
        char *dn = ldap_get_dn(m_ldap, entry);
        DirectoryEntry result(dn ? dn : "");
        ldap_memfree(dn);

        for (size_t i = 0; i < attr.size(); i++) {
            MessageVals vals = ldap_get_values_len(m_ldap, entry, attr[i].c_str());
            if (vals) {
                size_t j = 0;
                while (berval *val = vals[j]) {
                    result.add_value(attr[i], std::string(val->bv_val, val->bv_len));
                    j++;
                }
            }
        }
        entries.push_back(result);
    }
    VERBOSEldap("ldap_search_ext_s returned %d entries", (int) entries.size());
    return entries;
}

int LDAPConnection::modify_ext(const std::string &dn, const std::string& type,
        char *vals[], int op)
{
    LDAPMod *mod_attrs[2];
    LDAPMod attr;

    int ret;

    mod_attrs[0] = &attr;
    attr.mod_op = op;
    attr.mod_type = const_cast<char *>(type.c_str());
    attr.mod_values = vals;
    mod_attrs[1] = NULL;

    VERBOSEldap("calling ldap_modify_ext_s");
    ret = ldap_modify_ext_s(m_ldap, dn.c_str(), mod_attrs, NULL, NULL);
    if (ret != LDAP_SUCCESS) {
        VERBOSE("ldap_modify_ext_s failed (%s)", ldap_err2string(ret));
    }
    return ret;
}

int LDAPConnection::modify_ext(const std::string &dn, const std::string& type,
        BerValue *vals[], int op)
{
    LDAPMod *mod_attrs[2];
    LDAPMod attr;

    int ret;

    mod_attrs[0] = &attr;
    attr.mod_op = op | LDAP_MOD_BVALUES;
    attr.mod_type = const_cast<char *>(type.c_str());
    attr.mod_bvalues = vals;
    mod_attrs[1] = NULL;

    VERBOSEldap("calling ldap_modify_ext_s");
    ret = ldap_modify_ext_s(m_ldap, dn.c_str(), mod_attrs, NULL, NULL);
    if (ret != LDAP_SUCCESS) {
        VERBOSE("ldap_modify_ext_s failed (%s)", ldap_err2string(ret));
    }
    return ret;
}

int LDAPConnection::simple_set_attr(const std::string &dn,
        const std::string &type, const std::string &val)
{
    char *vals_name[] = { NULL, NULL };
    vals_name[0] = const_cast<char *>(val.c_str());
    return modify_ext(dn, type, vals_name, LDAP_MOD_REPLACE);
}

int LDAPConnection::set_binary_attr(const std::string &dn,
        const std::string &type, const std::string &val)
{
    BerValue bval;
    bval.bv_val = const_cast<char *>(val.data());
    bval.bv_len = val.length();
    BerValue *vals[] = { &bval, NULL };
    return modify_ext(dn, type, vals, LDAP_MOD_REPLACE);
}

void LDAPConnection::add(const std::string &dn, const LDAP_mod& mod)
{
    std::vector<LDAPMod*> tmp = mod.get();
    tmp.push_back(NULL);

    VERBOSEldap("calling ldap_add_ext_s for %s", dn.c_str());
    int ret = ldap_add_ext_s(m_ldap, dn.c_str(),
                             const_cast<LDAPMod **>(&tmp[0]),
                             NULL,
                             NULL);
    if (ret) {
        print_diagnostics("ldap_add_ext_s failed", ret);
        throw LDAPException("ldap_add_ext_s", ret, diagnostic_message());
    }
}


DirectorySession *LDAPConnector::connect(const DirectoryConfig &config)
{
    return new LDAPConnection(config);
}


void LDAP_mod::add(const std::string& type, const std::string& val)
{
    LDAPMod *lm = new LDAPMod;
    lm->mod_type = strdup(type.c_str());
    char **mv = new char *[2];
    mv[0] = strdup(val.c_str());
    mv[1] = NULL;
    lm->mod_values = mv;
    lm->mod_op = LDAP_MOD_ADD;
    attrs.push_back(lm);
}

void LDAP_mod::add(const std::string& type,
        const std::vector<std::string>& val)
{
    LDAPMod *lm = new LDAPMod;
    lm->mod_op = LDAP_MOD_ADD;
    lm->mod_type = strdup(type.c_str());
    char **mv = new char *[val.size() + 1];
    for (unsigned int i = 0; i < val.size(); i++) {
        mv[i] = strdup(val[i].c_str());
    }
    mv[val.size()] = NULL;
    lm->mod_values = mv;

    attrs.push_back(lm);
}

void LDAP_mod::add_binary(const std::string& type, const std::string& val)
{
    LDAPMod *lm = new LDAPMod;
    lm->mod_op = LDAP_MOD_ADD | LDAP_MOD_BVALUES;
    lm->mod_type = strdup(type.c_str());
    lm->mod_bvalues = new BerValue *[2];
    lm->mod_bvalues[0] = new BerValue;
    lm->mod_bvalues[0]->bv_val = new char[val.length()];
    memcpy(lm->mod_bvalues[0]->bv_val, val.data(), val.length());
    lm->mod_bvalues[0]->bv_len = val.length();
    lm->mod_bvalues[1] = NULL;
    attrs.push_back(lm);
}

LDAP_mod::~LDAP_mod()
{
    for (std::vector<LDAPMod*>::iterator ptr = attrs.begin();
            ptr != attrs.end(); ptr++) {
        if (*ptr) {
            LDAPMod *lm = *ptr;
            free(lm->mod_type);

            if (lm->mod_op & LDAP_MOD_BVALUES) {
                BerValue **p = lm->mod_bvalues;
                while (*p != NULL) {
                    memset((*p)->bv_val, 0, (*p)->bv_len);
                    delete[] (*p)->bv_val;
                    delete *p;
                    p++;
                }
                delete[] lm->mod_bvalues;
            } else {
                char **p = lm->mod_values;
                while (*p != NULL) {
                    free(*p++);
                }
                delete[] lm->mod_values;
            }
            delete lm;
        }
    }
    attrs.clear();
}

std::vector<LDAPMod *>
LDAP_mod::get() const
{
    return attrs;
}


std::string DirectoryEntry::key(const std::string &name)
{
    std::string result(name);
    for (std::string::iterator it = result.begin(); it != result.end(); ++it) {
        *it = std::tolower(*it);
    }
    return result;
}

void DirectoryEntry::add_value(const std::string &name, const std::string &val)
{
    m_attrs[key(name)].push_back(val);
}

void DirectoryEntry::set_value(const std::string &name, const std::string &val)
{
    std::vector<std::string> &vals = m_attrs[key(name)];
    vals.clear();
    vals.push_back(val);
}

bool DirectoryEntry::has_attr(const std::string &name) const
{
    std::map<std::string, std::vector<std::string> >::const_iterator it =
        m_attrs.find(key(name));
    return it != m_attrs.end() && !it->second.empty();
}

std::string DirectoryEntry::get_one_val(const std::string &name) const
{
    std::map<std::string, std::vector<std::string> >::const_iterator it =
        m_attrs.find(key(name));
    if (it != m_attrs.end() && !it->second.empty()) {
        return it->second[0];
    }
    return "";
}

std::vector<std::string> DirectoryEntry::get_all_vals(const std::string &name) const
{
    std::map<std::string, std::vector<std::string> >::const_iterator it =
        m_attrs.find(key(name));
    if (it != m_attrs.end()) {
        return it->second;
    }
    return std::vector<std::string>();
}
