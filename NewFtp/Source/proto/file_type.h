// *****************************************************************************
// * This file is part of the NewFtp project. It is distributed under          *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_TYPE_H_6602183745091273
#define FILE_TYPE_H_6602183745091273

#include "ftp_mode.h"


namespace nftp
{
//classify by extension: known text formats => ASCII, everything else (including no extension) => binary
bool isBinaryFile(std::string_view fileName); //nothrow

TransferMode selectTransferMode(std::string_view fileName); //"auto" mode
}

#endif //FILE_TYPE_H_6602183745091273
