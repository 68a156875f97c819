/* SPDX-License-Identifier: GPL-2.0-or-later */
/* SPDX-FileCopyrightText: Copyright SUSE LLC */

/*
  rbkit - rebase or roll back an image based system
 */

#include "rbkit.hpp"
#include <exception>
#include <iostream>
using namespace std;

int main(int argc, char *argv[]) {
    try {
        RBKit rb{argc, argv};
    } catch (int e) {
        return e;
    } catch (const exception &e) {
        cerr << "ERROR: " << e.what() << endl;
        return 1;
    }
    return 0;
}
