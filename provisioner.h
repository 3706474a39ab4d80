/*
 *----------------------------------------------------------------------------
 *
 * provisioner.h
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

#ifndef PROVISIONER_H
#define PROVISIONER_H 1

#include <string>
#include <vector>

class DirectoryConfig;
class DirectorySession;
class DirectoryConnector;
class ParameterStore;
class PersonIdentity;
class ProvisioningResult;

/* One way of putting the initial password on a freshly created account.
 * Returns true on success; on failure, a reason is left in <diagnostic>. */
class PasswordSetter {
public:
    virtual ~PasswordSetter() {}
    virtual const char *name() const = 0;
    virtual bool set_password(DirectorySession &session,
                              const std::string &dn,
                              const std::string &login_name,
                              const std::string &password,
                              std::string &diagnostic) = 0;
};


/* Replace unicodePwd over the LDAP session. Needs a protected transport. */
class UnicodePwdSetter : public PasswordSetter {
public:
    const char *name() const { return "unicodePwd"; }
    bool set_password(DirectorySession &session,
                      const std::string &dn,
                      const std::string &login_name,
                      const std::string &password,
                      std::string &diagnostic);
};


/* Administrative reset through the domain controller's kpasswd service,
 * authenticated as the directory administrator. */
class KpasswdResetSetter : public PasswordSetter {
    const DirectoryConfig &m_config;
public:
    explicit KpasswdResetSetter(const DirectoryConfig &config) : m_config(config) {}
    const char *name() const { return "kpasswd"; }
    bool set_password(DirectorySession &session,
                      const std::string &dn,
                      const std::string &login_name,
                      const std::string &password,
                      std::string &diagnostic);
};


enum provisioning_state {
    STATE_START = 0,
    STATE_CHECKED,
    STATE_CREATED,
    STATE_PASSWORD_SET,
    STATE_ENABLED,
    STATE_VERIFIED,
    STATE_FAILED
};

extern const char *provisioning_state_name(provisioning_state state);


class AccountProvisioner {
    DirectorySession &m_session;
    const DirectoryConfig &m_config;
    std::vector<PasswordSetter *> m_setters;
    UnicodePwdSetter m_unicode_pwd;
    KpasswdResetSetter m_kpasswd;
    provisioning_state m_state;
    std::string m_account_dn;

    void transition(provisioning_state next);
    void set_initial_password(const std::string &login_name,
                              const std::string &password);

    // make it non copyable
    AccountProvisioner(const AccountProvisioner&);
    const AccountProvisioner& operator=(const AccountProvisioner&);

public:
    /* Uses unicodePwd, then (if enabled in <config>) the kpasswd reset. */
    AccountProvisioner(DirectorySession &session, const DirectoryConfig &config);

    /* Password strategies are tried in the given order; not owned. */
    AccountProvisioner(DirectorySession &session, const DirectoryConfig &config,
                       const std::vector<PasswordSetter *> &setters);

    ProvisioningResult provision(const std::string &container_dn,
                                 const PersonIdentity &identity);

    provisioning_state state() const { return m_state; }
    const std::string &account_dn() const { return m_account_dn; }
};


/* Resolve config, connect, provision, disconnect. Never throws for
 * configuration, connection or directory failures. */
extern ProvisioningResult provision_account(const ParameterStore &store,
                                            const PersonIdentity &identity,
                                            DirectoryConnector &connector);
extern ProvisioningResult provision_account(const ParameterStore &store,
                                            const PersonIdentity &identity);

#endif
