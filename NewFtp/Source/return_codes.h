// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETURN_CODES_H_92017354820137465
#define RETURN_CODES_H_92017354820137465


namespace nftp
{
enum class NftpExitCode //as returned on process exit
{
    success = 0,
    error,
    usage,
};


inline
void raiseExitCode(NftpExitCode& rc, NftpExitCode rcProposed)
{
    if (rc < rcProposed)
        rc = rcProposed;
}
}

#endif //RETURN_CODES_H_92017354820137465
