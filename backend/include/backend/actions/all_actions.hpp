#pragma once

#include <backend/actions/list_refresh_action.hpp>
#include <backend/actions/login_action.hpp>
#include <backend/actions/logout_action.hpp>
#include <backend/actions/more_info_action.hpp>
#include <backend/actions/move_action.hpp>
#include <backend/actions/recycle_bin_action.hpp>
#include <backend/actions/recycle_bin_list_action.hpp>
#include <backend/actions/remove_action.hpp>
#include <backend/actions/rename_mkdir_action.hpp>
#include <backend/actions/set_password_action.hpp>
#include <backend/actions/share_details_action.hpp>
#include <backend/actions/share_info_action.hpp>
#include <backend/actions/update_check_action.hpp>
