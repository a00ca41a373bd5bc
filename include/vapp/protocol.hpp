#pragma once

#include <vapp/protocol/account.hpp>
#include <vapp/protocol/address.hpp>
#include <vapp/protocol/message.hpp>
#include <vapp/protocol/receipt.hpp>
#include <vapp/protocol/serialization.hpp>
#include <vapp/protocol/transaction.hpp>
