/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#pragma once
#include <stdexcept>
#include <string>

namespace plsync {

    enum class ErrorKind {
        RemoteUnavailable,   // listing failed, nothing touched
        RetrievalFailed,     // one addition failed, skipped
        AgeRestricted,       // one addition permanently unobtainable
        Unavailable,         // one addition permanently unobtainable
        FilesystemFailure,   // backup/rename/delete/state write failed
        CorruptState,        // state document unreadable or inconsistent
        RestoreFailed,       // recovery itself failed, backup kept on disk
        Locked,              // another transaction owns the directory
        AlreadyInitialized,  // download into an already synchronized directory
        EmptyRemoteRefused,  // remote listing empty and policy forbids wiping
        InvalidArgument
    };

    inline const char* error_kind_name(ErrorKind kind) {
        switch (kind) {
            case ErrorKind::RemoteUnavailable:  return "RemoteUnavailable";
            case ErrorKind::RetrievalFailed:    return "RetrievalFailed";
            case ErrorKind::AgeRestricted:      return "AgeRestricted";
            case ErrorKind::Unavailable:        return "Unavailable";
            case ErrorKind::FilesystemFailure:  return "FilesystemFailure";
            case ErrorKind::CorruptState:       return "CorruptState";
            case ErrorKind::RestoreFailed:      return "RestoreFailed";
            case ErrorKind::Locked:             return "Locked";
            case ErrorKind::AlreadyInitialized: return "AlreadyInitialized";
            case ErrorKind::EmptyRemoteRefused: return "EmptyRemoteRefused";
            case ErrorKind::InvalidArgument:    return "InvalidArgument";
        }
        return "Unknown";
    }

    // Per-item failures that mark the item as never retrievable
    inline bool is_permanent_exclusion(ErrorKind kind) {
        return kind == ErrorKind::AgeRestricted || kind == ErrorKind::Unavailable;
    }

    class SyncError : public std::runtime_error {
    public:
        SyncError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message), kind_(kind) {}

        ErrorKind kind() const { return kind_; }

    private:
        ErrorKind kind_;
    };

} // namespace plsync
