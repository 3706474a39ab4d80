/*
 *----------------------------------------------------------------------------
 *
 * adprov.cpp
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

/* GLOBALS */

int g_verbose = 0;

std::string sform(const char* format, ...)
{
    va_list args;
    va_start(args, format);

    char *buf;
#if !defined(HAVE_VASPRINTF)
#  ifdef HAVE_VSNPRINTF
    buf = (char *) malloc(10000);
    memset(buf, 0, 10000);
    int result =  vsnprintf(buf, 10000-1, format, args);
#  else
#   error need either vasprintf or vsnprintf
#  endif
#else
    int result = vasprintf(&buf, format, args);
#endif
    va_end(args);
    if (result < 0) {
        throw std::runtime_error("vasprintf failed");
    }
    std::string outstr(buf, result);
    free(buf);
    return outstr;
}


ProvisioningResult ProvisioningResult::success(const std::string &username,
                                               const std::string &initial_password)
{
    ProvisioningResult result;
    result.m_success = true;
    result.m_username = username;
    result.m_initial_password = initial_password;
    return result;
}


ProvisioningResult ProvisioningResult::error(provisioning_error_family family,
                                             const std::string &message)
{
    ProvisioningResult result;
    result.m_success = false;
    result.m_family = family;
    result.m_error_message = message.empty() ? "Unknown error" : message;
    return result;
}


void ProvisioningResult::wipe()
{
    wipe_password(m_initial_password);
}


const char *provisioning_state_name(provisioning_state state)
{
    switch (state) {
        case STATE_START:
            return "Start";
        case STATE_CHECKED:
            return "Checked";
        case STATE_CREATED:
            return "Created";
        case STATE_PASSWORD_SET:
            return "PasswordSet";
        case STATE_ENABLED:
            return "Enabled";
        case STATE_VERIFIED:
            return "Verified";
        case STATE_FAILED:
            return "Failed";
    }
    return "Unknown";
}


AccountProvisioner::AccountProvisioner(DirectorySession &session,
                                       const DirectoryConfig &config) :
    m_session(session),
    m_config(config),
    m_kpasswd(config),
    m_state(STATE_START)
{
    m_setters.push_back(&m_unicode_pwd);
    if (config.password_reset_fallback) {
        m_setters.push_back(&m_kpasswd);
    }
}


AccountProvisioner::AccountProvisioner(DirectorySession &session,
                                       const DirectoryConfig &config,
                                       const std::vector<PasswordSetter *> &setters) :
    m_session(session),
    m_config(config),
    m_setters(setters),
    m_kpasswd(config),
    m_state(STATE_START)
{
}


void AccountProvisioner::transition(provisioning_state next)
{
    VERBOSE("%s -> %s", provisioning_state_name(m_state),
            provisioning_state_name(next));
    m_state = next;
}


void AccountProvisioner::set_initial_password(const std::string &login_name,
                                              const std::string &password)
{
    std::string reasons;
    for (size_t i = 0; i < m_setters.size(); i++) {
        std::string diagnostic;
        if (m_setters[i]->set_password(m_session, m_account_dn, login_name,
                                       password, diagnostic)) {
            VERBOSE("Password set using %s", m_setters[i]->name());
            return;
        }
        VERBOSE("Setting password using %s failed: %s",
                m_setters[i]->name(), diagnostic.c_str());
        if (!reasons.empty()) {
            reasons += "; ";
        }
        reasons += sform("%s: %s", m_setters[i]->name(), diagnostic.c_str());
    }
    if (reasons.empty()) {
        reasons = "no password strategy configured";
    }
    throw ProvisioningError(PROVISIONING_PASSWORD_SET_FAILED,
                            "password set failed: " + reasons);
}


ProvisioningResult AccountProvisioner::provision(const std::string &container_dn,
                                                 const PersonIdentity &identity)
{
    std::string password;
    m_state = STATE_START;
    m_account_dn.clear();

    try {
        check_login_name(identity.login_name);

        std::string existing = ldap_find_account(m_session, m_config.base_dn(),
                                                 identity.login_name);
        if (!existing.empty()) {
            m_account_dn = existing;
            throw ProvisioningError(PROVISIONING_ALREADY_EXISTS,
                                    sform("User already exists: %s",
                                          existing.c_str()));
        }
        transition(STATE_CHECKED);

        password = generate_new_password(m_config.password_length,
                                         identity.login_name);

        m_account_dn = ldap_create_account(m_session, m_config, container_dn,
                                           identity);
        transition(STATE_CREATED);

        set_initial_password(identity.login_name, password);
        transition(STATE_PASSWORD_SET);

        ldap_enable_account(m_session, m_account_dn);
        transition(STATE_ENABLED);

        ldap_verify_account_enabled(m_session, m_account_dn);
        transition(STATE_VERIFIED);
    } catch (std::exception &e) {
        fprintf(stderr, "Error: provisioning %s failed in state %s: %s\n",
                identity.login_name.c_str(), provisioning_state_name(m_state),
                e.what());
        transition(STATE_FAILED);
        wipe_password(password);
        return ProvisioningResult::error(ERROR_PROVISIONING, e.what());
    }

    fprintf(stdout, "Account %s created and enabled.\n",
            identity.login_name.c_str());
    ProvisioningResult result = ProvisioningResult::success(identity.login_name,
                                                            password);
    wipe_password(password);
    return result;
}


ProvisioningResult provision_account(const ParameterStore &store,
                                     const PersonIdentity &identity,
                                     DirectoryConnector &connector)
{
    DirectoryConfig config;
    std::string container_dn;
    try {
        config = resolve_config(store);
        container_dn = resolve_container_dn(config);
    } catch (std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return ProvisioningResult::error(ERROR_CONFIG, e.what());
    }
    VERBOSE("Using container: %s", container_dn.c_str());

    std::unique_ptr<DirectorySession> session;
    try {
        session.reset(connector.connect(config));
    } catch (std::exception &e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return ProvisioningResult::error(ERROR_CONNECTION, e.what());
    }

    AccountProvisioner provisioner(*session, config);
    ProvisioningResult result = provisioner.provision(container_dn, identity);
    session->close();
    return result;
}


ProvisioningResult provision_account(const ParameterStore &store,
                                     const PersonIdentity &identity)
{
    LDAPConnector connector;
    return provision_account(store, identity, connector);
}
