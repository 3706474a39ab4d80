/*
 *----------------------------------------------------------------------------
 *
 * adprovevent.cpp
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


const char *sync_status_name(sync_status status)
{
    switch (status) {
        case SYNC_PENDING:
            return "pending";
        case SYNC_SUCCESS:
            return "success";
        case SYNC_ERROR:
            return "error";
    }
    return "unknown";
}


static bool is_blank(const std::string &s)
{
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}


/* Checked before anything is sent to the directory. Returns an empty
 * string if the request can be processed. */
static std::string validate_request(const OnboardingAccountRequested &event)
{
    if (is_blank(event.work_email)) {
        return "Work email is required to create an Active Directory account.";
    }
    if (is_blank(event.full_name)) {
        return "Employee name is required.";
    }
    return "";
}


ProvisioningResult handle_onboarding_event(const OnboardingAccountRequested &event,
                                           const ParameterStore &store,
                                           DirectoryConnector &connector,
                                           OnboardingHost &host)
{
    VERBOSE("Account requested for person %s", event.person_id.c_str());

    std::string invalid = validate_request(event);
    if (!invalid.empty()) {
        fprintf(stderr, "Error: %s\n", invalid.c_str());
        host.report(event.person_id, false, invalid);
        return ProvisioningResult::error(ERROR_INVALID_REQUEST, invalid);
    }

    PersonIdentity identity = make_person_identity(event.full_name,
                                                   event.work_email,
                                                   event.work_phone);
    ProvisioningResult result = provision_account(store, identity, connector);

    if (!result.is_success()) {
        host.set_sync_status(event.person_id, SYNC_ERROR);
        host.report(event.person_id, false,
                    "Active Directory account creation failed: " +
                    result.error_message());
        return result;
    }

    host.record_account(event.person_id, result.username());
    host.set_sync_status(event.person_id, SYNC_SUCCESS);

    std::string message = sform("Active Directory account created successfully. "
                                "Username: %s.", result.username().c_str());
    if (host.deliver_credentials(event.person_id, identity.email_address,
                                 result.username(), result.initial_password())) {
        message += sform(" Credentials have been sent to the employee's email (%s).",
                         identity.email_address.c_str());
    } else {
        fprintf(stderr, "Warning: could not deliver credentials for %s to %s\n",
                result.username().c_str(), identity.email_address.c_str());
        message += sform(" Credentials could not be sent to %s.",
                         identity.email_address.c_str());
    }
    host.report(event.person_id, true, message);
    return result;
}
