/*
 *----------------------------------------------------------------------------
 *
 * adprov.h
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

#ifndef __adprov_h__
#define __adprov_h__


#include "config.h"

#include <stdio.h>
#include <stdarg.h>
#include <string.h>
#include <stdlib.h>
#include <errno.h>
#include <ldap.h>

#ifdef HAVE_COM_ERR_H
# ifdef COM_ERR_NEEDS_EXTERN_C
  extern "C" {
# endif
#include <com_err.h>
# ifdef COM_ERR_NEEDS_EXTERN_C
 }
# endif
#endif
#include <krb5.h>


#include <stdexcept>
#include <string>
#include <vector>
#include <memory>

#ifndef PACKAGE_NAME
#define PACKAGE_NAME "adprov"
#endif
#define DEFAULT_PASSWORD_LEN            16
#define MIN_PASSWORD_LEN                8
#define MAX_PASSWORD_LEN                127
#define MAX_SAM_ACCOUNT_LEN             20
#define DEFAULT_CONNECT_TIMEOUT         10
#define DEFAULT_LDAPS_PORT              636
#define DEFAULT_LDAP_PORT               389

/* Configuration keys read from the host's parameter store */
#define CONF_AD_SERVER                  "onboarding.ad_server"
#define CONF_DOMAIN                     "onboarding.domain"
#define CONF_ADMIN_USER                 "onboarding.admin_user"
#define CONF_ADMIN_PASSWORD             "onboarding.admin_password"
#define CONF_USERS_OU                   "onboarding.users_ou"
#define CONF_OU_PATH                    "onboarding.ou_path"
#define CONF_LDAP_SECURE                "onboarding.ldap_secure"
#define CONF_LDAPS_PORT                 "onboarding.ldaps_port"
#define CONF_LDAP_PORT                  "onboarding.ldap_port"
#define CONF_VALIDATE_CERT              "onboarding.ldaps_validate_cert"
#define CONF_CA_CERT_FILE               "onboarding.ldap_ca_cert_file"
#define CONF_CONNECT_TIMEOUT            "onboarding.ldap_connect_timeout"
#define CONF_PASSWORD_LENGTH            "onboarding.password_length"
#define CONF_PASSWORD_FALLBACK          "onboarding.password_reset_fallback"

/* From SAM.H */
#define UF_ACCOUNTDISABLE               0x00000002
#define UF_NORMAL_ACCOUNT               0x00000200

extern int g_verbose;

enum transport_mode {
    TRANSPORT_LDAPS = 0,
    TRANSPORT_STARTTLS,
    TRANSPORT_PLAIN
};

/* Everything needed to reach and authenticate to the directory. Built fresh
 * for every provisioning call by resolve_config(). */
class DirectoryConfig {
public:
    std::string server;
    std::string domain;
    std::string admin_user;
    std::string admin_password;
    std::string users_ou_dn;
    std::string ou_path;
    transport_mode transport;
    int port;
    bool validate_cert;
    std::string ca_cert_file;
    int connect_timeout;
    int password_length;
    bool password_reset_fallback;

    DirectoryConfig();

    std::string base_dn() const;
    std::string realm() const;
};

class PersonIdentity {
public:
    std::string given_name;
    std::string surname;
    std::string login_name;
    std::string email_address;
    std::string telephone;

    std::string display_name() const;
};

enum provisioning_error_family {
    ERROR_NONE = 0,
    ERROR_CONFIG,
    ERROR_CONNECTION,
    ERROR_PROVISIONING,
    ERROR_INVALID_REQUEST
};

/* Outcome of one provisioning call. Either username and initial password
 * are set, or the error message is; never both. */
class ProvisioningResult {
    bool m_success;
    provisioning_error_family m_family;
    std::string m_username;
    std::string m_error_message;
    std::string m_initial_password;

    ProvisioningResult() : m_success(false), m_family(ERROR_NONE) {}

public:
    static ProvisioningResult success(const std::string &username,
                                      const std::string &initial_password);
    static ProvisioningResult error(provisioning_error_family family,
                                    const std::string &message);

    bool is_success() const { return m_success; }
    bool has_username() const { return m_success; }
    bool has_initial_password() const { return m_success; }
    bool has_error() const { return !m_success; }
    provisioning_error_family error_family() const { return m_family; }

    const std::string &username() const { return m_username; }
    const std::string &error_message() const { return m_error_message; }
    const std::string &initial_password() const { return m_initial_password; }

    /* Overwrite the password once it has been delivered. */
    void wipe();
};

/* printf into a C++ string. */
std::string sform(const char* format, ...);

class Exception : public std::exception
{
  protected:
    std::string m_message;

    /* Prohibit assignment */
    Exception& operator=(const Exception&);

  public:
    /* Constructors */

    /* Default construction with no message uses "Exception" */
    Exception() : m_message("Exception") { }
    explicit Exception(char const * simple_string) : m_message(simple_string) {}
    explicit Exception(const std::string &str) : m_message(str) {}
    Exception(const Exception& src) : exception(), m_message(src.m_message)  {}

    virtual ~Exception() throw() {};
    char const * what() const throw() { return m_message.c_str(); }
};

class KRB5Exception : public Exception
{
  protected:
    krb5_error_code m_err;
  public:
    explicit KRB5Exception(const std::string &func, krb5_error_code err) :
        Exception(sform("Error: %s failed (%s)", func.c_str(), error_message(err)))
    { m_err = err; }
    krb5_error_code err() const throw() { return m_err; }

};

class LDAPException : public Exception
{
  protected:
    int m_err;
    std::string m_diagnostic;
  public:
    explicit LDAPException(const std::string &func, int err,
                           const std::string &diagnostic = "") :
        Exception(sform("Error: %s failed (%s)", func.c_str(), ldap_err2string(err))),
        m_err(err),
        m_diagnostic(diagnostic)
    {}
    virtual ~LDAPException() throw() {}
    int err() const throw() { return m_err; }
    const std::string &diagnostic() const throw() { return m_diagnostic; }
};

enum config_error_kind {
    CONFIG_MISSING_REQUIRED_FIELD,
    CONFIG_INVALID_VALUE
};

class ConfigError : public Exception
{
    config_error_kind m_kind;
  public:
    ConfigError(config_error_kind kind, const std::string &message) :
        Exception(message), m_kind(kind) {}
    config_error_kind kind() const throw() { return m_kind; }
};

enum connection_error_kind {
    CONNECTION_NETWORK_UNREACHABLE,
    CONNECTION_TLS_NEGOTIATION_FAILED,
    CONNECTION_AUTHENTICATION_REJECTED
};

class ConnectionError : public Exception
{
    connection_error_kind m_kind;
  public:
    ConnectionError(connection_error_kind kind, const std::string &message) :
        Exception(message), m_kind(kind) {}
    connection_error_kind kind() const throw() { return m_kind; }
};

enum provisioning_error_kind {
    PROVISIONING_INVALID_IDENTITY,
    PROVISIONING_ALREADY_EXISTS,
    PROVISIONING_CREATE_REJECTED,
    PROVISIONING_PASSWORD_SET_FAILED,
    PROVISIONING_ENABLE_FAILED,
    PROVISIONING_VERIFY_MISMATCH,
    PROVISIONING_DIRECTORY_ERROR
};

class ProvisioningError : public Exception
{
    provisioning_error_kind m_kind;
  public:
    ProvisioningError(provisioning_error_kind kind, const std::string &message) :
        Exception(message), m_kind(kind) {}
    provisioning_error_kind kind() const throw() { return m_kind; }
};

#ifdef __GNUC__
#define ATTRUNUSED __attribute__((unused))
#else
#define ATTRUNUSED
#endif

/* Verbose messages */
#define VERBOSE(text...) if (g_verbose) { fprintf(stdout, " -- %s: ", __FUNCTION__); fprintf(stdout, ## text); fprintf(stdout, "\n"); }


#include "krb5wrap.h"
#include "directory.h"
#include "ldapconnection.h"
#include "parameters.h"
#include "provisioner.h"
#include "onboarding.h"

/* Prototypes */

/* adprovconf.cpp */
extern DirectoryConfig resolve_config(const ParameterStore &store);
extern bool parse_bool_value(const std::string &key, const std::string &value);
extern transport_mode parse_transport_mode(const std::string &value);
extern const char *transport_mode_name(transport_mode mode);

/* adprovldap.cpp */
extern std::string get_base_dn(const std::string &domain);
extern std::vector<std::string> split_ou_path(const std::string &ou_path);
extern std::string resolve_container_dn(const DirectoryConfig &config);
extern std::string ldap_escape_dn_value(const std::string &value);
extern std::string ldap_escape_filter_value(const std::string &value);
extern std::string ldap_find_account(DirectorySession &session,
                                     const std::string &base_dn,
                                     const std::string &login_name);
extern std::string ldap_create_account(DirectorySession &session,
                                       const DirectoryConfig &config,
                                       const std::string &container_dn,
                                       const PersonIdentity &identity);
extern void ldap_enable_account(DirectorySession &session,
                                const std::string &dn);
extern void ldap_verify_account_enabled(DirectorySession &session,
                                        const std::string &dn);

/* adprovname.cpp */
extern PersonIdentity make_person_identity(const std::string &full_name,
                                           const std::string &work_email,
                                           const std::string &work_phone = "");
extern std::string derive_login_name(const std::string &work_email);
extern void check_login_name(const std::string &login_name);

/* adprovpass.cpp */
extern std::string generate_new_password(size_t length,
                                         const std::string &login_name);
extern void wipe_password(std::string &password);
extern bool password_is_complex(const std::string &password);

/* adprovutf.cpp */
extern std::string encode_unicode_pwd(const std::string &password);
extern std::string transcode_utf8_utf16le(const std::string &source);

#endif
