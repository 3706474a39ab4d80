/*
 *----------------------------------------------------------------------------
 *
 * onboarding.h
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

#ifndef ONBOARDING_H
#define ONBOARDING_H 1

#include <string>

class DirectoryConnector;
class ParameterStore;
class ProvisioningResult;

/* Raised by the host when the "create directory account" onboarding step
 * is completed for a person. */
class OnboardingAccountRequested {
public:
    std::string person_id;
    std::string full_name;
    std::string work_email;
    std::string work_phone;
};

enum sync_status {
    SYNC_PENDING = 0,
    SYNC_SUCCESS,
    SYNC_ERROR
};

extern const char *sync_status_name(sync_status status);

/* Where the outcome of an onboarding event goes. Implemented by the host. */
class OnboardingHost {
public:
    virtual ~OnboardingHost() {}

    virtual void set_sync_status(const std::string &person_id,
                                 sync_status status) = 0;
    virtual void record_account(const std::string &person_id,
                                const std::string &username) = 0;
    /* Called at most once per event. Returns false if the credentials could
     * not be handed over. */
    virtual bool deliver_credentials(const std::string &person_id,
                                     const std::string &work_email,
                                     const std::string &username,
                                     const std::string &password) = 0;
    /* <message> is shown to people; it never contains the password. */
    virtual void report(const std::string &person_id, bool success,
                        const std::string &message) = 0;
};

extern ProvisioningResult handle_onboarding_event(const OnboardingAccountRequested &event,
                                                  const ParameterStore &store,
                                                  DirectoryConnector &connector,
                                                  OnboardingHost &host);

#endif
