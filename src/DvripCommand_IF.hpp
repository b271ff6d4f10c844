#ifndef DVRIPCOMMAND_IF_HPP
#define DVRIPCOMMAND_IF_HPP
/**
 * @file DvripCommand_IF.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Declares the command codes of the DVRIP camera control protocol.
 */
#include <cstdint>
#include <string>
#include <tuple>

namespace DvripComm
{

/*
 * XMacro to define list of all DVRIP commands and their values
 */
#define DVRIP_CMDS                                                      \
   DVRIP_CMD(LOGIN_REQ                                         , 1000) \
   DVRIP_CMD(LOGIN_RSP                                         , 1001) \
   DVRIP_CMD(LOGOUT_REQ                                        , 1002) \
   DVRIP_CMD(LOGOUT_RSP                                        , 1003) \
   DVRIP_CMD(KEEPALIVE_REQ                                     , 1006) \
   DVRIP_CMD(KEEPALIVE_RSP                                     , 1007) \
                                                                        \
   DVRIP_CMD(SYSINFO_REQ                                       , 1020) \
   DVRIP_CMD(SYSINFO_RSP                                       , 1021) \
                                                                        \
   DVRIP_CMD(CONFIG_GET_REQ                                    , 1042) \
   DVRIP_CMD(CONFIG_GET_RSP                                    , 1043) \
                                                                        \
   DVRIP_CMD(PTZ_REQ                                           , 1400) \
   DVRIP_CMD(PTZ_RSP                                           , 1401) \
                                                                        \
   DVRIP_CMD(PLAYBACK_REQ                                      , 1420) \
   DVRIP_CMD(PLAYBACK_RSP                                      , 1421) \
                                                                        \
   DVRIP_CMD(FILESEARCH_REQ                                    , 1440) \
   DVRIP_CMD(FILESEARCH_RSP                                    , 1441) \

/*
 * Create an enum where each enumerator has its command value
 */
#undef DVRIP_CMD
#define DVRIP_CMD(name,value) name = value,

enum DvripCommand : uint32_t
{
    DVRIP_CMDS
};

/// Value of the Ret field that indicates success.
inline constexpr int RET_OK { 100 };

} // namespace DvripComm

#endif // DVRIPCOMMAND_IF_HPP
